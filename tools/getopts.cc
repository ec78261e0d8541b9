/*
 * Copyright (C) 2005-2017 Christoph Rupp (chris@crupp.de).
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * See the file COPYING for License information.
 */

#include <stdio.h>
#include <string.h>

#include "getopts.h"

namespace Impl {

static int cur = 0;
static int argc = 0;
static char **argv = 0;
static const char *program = 0;

static bool
starts_with(const char *p, const char *needle) {
  return ::strncmp(p, needle, ::strlen(needle)) == 0;
}

// consumes |name| if |*pp| is "name", "name:arg" or "name=arg"
static bool
consume_option_by_name(const char **pp, const char *name) {
  const char *p = *pp;
  if (!starts_with(p, name))
    return false;

  p += ::strlen(name);
  if (*p == '\0') {
    *pp = p;
    return true;
  }
  if (*p == ':' || *p == '=') {
    *pp = p + 1;
    return true;
  }
  return false;
}

static option_t *
find_option(const char **pp, option_t *options, bool longname) {
  for (; options->name; options++) {
    const char *name = longname ? options->longopt : options->shortopt;
    if (name && consume_option_by_name(pp, name))
      return options;
  }
  return 0;
}

static unsigned int
parse_parameter(const char *p, option_t *options, const char **param)
{
  option_t *o = 0;
  const char *arg = p;

  *param = p;

  // a single "-" is a parameter (i.e. stdin)
  if (starts_with(p, "--") && p[2] != '\0') {
    arg = p + 2;
    o = find_option(&arg, options, true);
  }
  else if (starts_with(p, "-") && p[1] != '\0') {
    arg = p + 1;
    o = find_option(&arg, options, false);
  }
  else
    return GETOPTS_PARAMETER;

  if (!o)
    return GETOPTS_UNKNOWN;

  if (!(o->flags & GETOPTS_NEED_ARGUMENT)) {
    *param = 0;
    return o->name;
  }

  // the argument is either attached ("--url=x") or follows ("--url x")
  if (*arg == '\0') {
    if (cur >= argc)
      return GETOPTS_MISSING_PARAM;
    arg = argv[cur++];
  }

  *param = arg;
  return o->name;
}

static void
getopts_init(int argc_, char **argv_, const char *program_)
{
  cur = 0;
  argc = argc_ - 1;
  argv = argv_ + 1;
  program = program_;
}

static void
getopts_usage(option_t *options)
{
  printf("usage: %s <options> <parameters>\n", program);
  for (; options->name; options++) {
    const char *arg = (options->flags & GETOPTS_NEED_ARGUMENT) ? "=<arg>" : "";
    if (options->shortopt)
      printf("  -%s, --%s%s: %s\n", options->shortopt, options->longopt,
             arg, options->helpdesc);
    else
      printf("  --%s%s: %s\n", options->longopt, arg, options->helpdesc);
  }
}

static unsigned int
getopts(option_t *options, const char **param)
{
  if (!argv || !options || !param)
    return GETOPTS_NO_INIT;

  if (cur >= argc)
    return 0;

  const char *p = argv[cur];
  cur++;
  return parse_parameter(p, options, param);
}

} // namespace Impl

void
getopts_init(int argc, char **argv, const char *program)
{
  Impl::getopts_init(argc, argv, program);
}

void
getopts_usage(option_t *options)
{
  Impl::getopts_usage(options);
}

unsigned int
getopts(option_t *options, const char **param)
{
  return Impl::getopts(options, param);
}
