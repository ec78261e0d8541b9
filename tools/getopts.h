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

/**
 * getopts() is a small library for reading and parsing command line
 * parameters. It supports
 *
 * - options with a short- and a long name
 *    i.e. an option with the short name "h" and the long name "help"
 *    can be used as "-h" or "--help"
 *
 * - options with an argument
 *    i.e. an option "url" (short "u") with an argument can be used like
 *    this: "-u <url>", "--url:<url>", "--url=<url>" or "--url <url>"
 *
 * - parameters (without an option)
 *    i.e. "kvh_client get mykey": "get" and "mykey" are parameters and
 *    are returned as GETOPTS_PARAMETER.
 *
 * The options are described in a table of option_t structures; the last
 * entry is zero'd:
 *
  option_t opts[] = {
    { ARG_HELP, "h", "help", "this help screen", 0 },
    { ARG_URL, "u", "url", "<url> the database url", GETOPTS_NEED_ARGUMENT },
    { 0, 0, 0, 0, 0 }
  };

  getopts_init(argc, argv, "kvh_client");

  unsigned int opt;
  const char *param;
  while ((opt = getopts(&opts[0], &param))) {
    if (opt == ARG_HELP)
      getopts_usage(&opts[0]);
    else if (opt == ARG_URL)
      printf("url is %s\n", param);
    else if (opt == GETOPTS_UNKNOWN)
      printf("unknown option %s\n", param);
  }
 *
 * argc/argv are stored statically, and therefore getopts() is NOT
 * thread-safe!
 */

#ifndef KVH_TOOLS_GETOPTS_H
#define KVH_TOOLS_GETOPTS_H

#ifdef __cplusplus
extern "C" {
#endif

/**
 * a structure which describes an option
 */
typedef struct
{
  /** the identifier of this option and the return value of getopts();
   * must not be 0 or one of the GETOPTS_* values */
  unsigned int name;

  /** the short option string, i.e. "u" for "-u" */
  const char *shortopt;

  /** the long option string, i.e. "url" for "--url" */
  const char *longopt;

  /** the help description, printed by getopts_usage */
  const char *helpdesc;

  /** flags of this entry; see below */
  unsigned int flags;

} option_t;

/** an option_t flag; set this flag if this option needs an argument */
#define GETOPTS_NEED_ARGUMENT         1

/** initializes the getopts-function with the arguments of main() */
extern void
getopts_init(int argc, char **argv, const char *program);

/** prints a help screen */
extern void
getopts_usage(option_t *options);

/**
 * returns the name of the next option, one of the predefined return
 * values below, or 0 if there are no more parameters. |param| points to
 * the argument of the option, or the parameter.
 */
extern unsigned int
getopts(option_t *options, const char **param);

/** return value of getopts(), if getopts_init() was not called */
#define GETOPTS_NO_INIT        0xffffffffu

/** return value of getopts() for unknown options */
#define GETOPTS_UNKNOWN        0xfffffffeu

/** return value of getopts() if an option expects an argument, but the
 * argument is missing */
#define GETOPTS_MISSING_PARAM  0xfffffffcu

/** return value of getopts() for parameters without an option */
#define GETOPTS_PARAMETER      0xfffffffbu

#ifdef __cplusplus
} // extern "C"
#endif

#endif /* KVH_TOOLS_GETOPTS_H */
