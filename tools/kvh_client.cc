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
#include <stdlib.h>
#include <string.h>

#include <iostream>
#include <string>
#include <vector>

#include <kvhttp/kvhttp.hpp>

#include "getopts.h"
#include "common.h"

#define ARG_HELP        1
#define ARG_URL         2
#define ARG_TIMEOUT     3
#define ARG_VERBOSE     4
#define ARG_DESCEND     5
#define ARG_BEGIN       6
#define ARG_END         7
#define ARG_SCAN        8
#define ARG_QUIET       9

/*
 * command line parameters
 */
static option_t opts[] = {
  {
    ARG_HELP,         // symbolic name of this option
    "h",          // short option
    "help",         // long option
    "this help screen",   // help string
    0 },          // no flags
  {
    ARG_URL,
    "u",
    "url",
    "the url of the database (i.e. http://localhost:8080/db)",
    GETOPTS_NEED_ARGUMENT },
  {
    ARG_TIMEOUT,
    "t",
    "timeout",
    "the request timeout in milliseconds",
    GETOPTS_NEED_ARGUMENT },
  {
    ARG_VERBOSE,
    "v",
    "verbose",
    "print the HTTP traffic",
    0 },
  {
    ARG_DESCEND,
    "d",
    "descend",
    "dump: iterate in descending order",
    0 },
  {
    ARG_BEGIN,
    "b",
    "begin",
    "dump: the first key (inclusive)",
    GETOPTS_NEED_ARGUMENT },
  {
    ARG_END,
    "e",
    "end",
    "dump: the last key (exclusive)",
    GETOPTS_NEED_ARGUMENT },
  {
    ARG_SCAN,
    "s",
    "scan",
    "dump: iterate in the server's order, ignores --begin and --end",
    0 },
  {
    ARG_QUIET,
    "q",
    "quiet",
    "suppress the banner",
    0 },
  { 0, 0, 0, 0, 0 }
};

static void
error(const char *foo, const kvhttp::error &e)
{
  if (e.get_http_status())
    fprintf(stderr, "%s: %s (HTTP %ld)\n", foo, e.get_string(),
            e.get_http_status());
  else if (!e.get_message().empty())
    fprintf(stderr, "%s: %s (%s)\n", foo, e.get_string(),
            e.get_message().c_str());
  else
    fprintf(stderr, "%s: %s\n", foo, e.get_string());
  exit(-1);
}

static void
print_usage()
{
  printf("usage: kvh_client --url=<url> [options] get <key>\n");
  printf("usage: kvh_client --url=<url> [options] set <key> [<value>]\n");
  printf("       (the value is read from stdin if it is missing)\n");
  printf("usage: kvh_client --url=<url> [options] delete <key>\n");
  printf("usage: kvh_client --url=<url> [options] dump\n");
  printf("usage: kvh_client -h\n");
  getopts_usage(&opts[0]);
}

static int
dump(kvhttp::db &db, bool scan, bool descend, const std::string &begin,
                const std::string &end)
{
  kvhttp::snapshot snap;
  try {
    snap = db.begin_snapshot();
  }
  catch (kvhttp::error &e) {
    error("begin_snapshot", e);
  }

  kvhttp::cursor c = scan
                  ? snap.scan()
                  : descend
                      ? snap.descend(begin, end)
                      : snap.ascend(begin, end);

  std::string key, value;
  uint64_t count = 0;
  while (c.next(&key, &value)) {
    std::cout << key << "\t" << value << std::endl;
    count++;
  }
  if (c.is_failed()) {
    release_session(snap);
    error("cursor::next", c.get_error());
  }

  try {
    snap.discard();
  }
  catch (kvhttp::error &e) {
    error("discard", e);
  }

  fprintf(stderr, "%llu entries\n", (unsigned long long)count);
  return 0;
}

int
main(int argc, char **argv)
{
  unsigned opt;
  const char *param;
  const char *url = 0;
  char *endptr = 0;
  uint32_t timeout = 0;
  bool verbose = false;
  bool descend = false;
  bool scan = false;
  bool quiet = false;
  std::string begin, end;
  std::vector<std::string> params;

  getopts_init(argc, argv, "kvh_client");

  while ((opt = getopts(&opts[0], &param))) {
    switch (opt) {
      case ARG_URL:
        url = param;
        break;
      case ARG_TIMEOUT:
        timeout = (uint32_t)strtoul(param, &endptr, 0);
        if (endptr && *endptr) {
          printf("Invalid parameter `timeout'; numerical value "
               "expected.\n");
          return (-1);
        }
        break;
      case ARG_VERBOSE:
        verbose = true;
        break;
      case ARG_DESCEND:
        descend = true;
        break;
      case ARG_BEGIN:
        begin = param;
        break;
      case ARG_END:
        end = param;
        break;
      case ARG_SCAN:
        scan = true;
        break;
      case ARG_QUIET:
        quiet = true;
        break;
      case GETOPTS_PARAMETER:
        params.push_back(param);
        break;
      case GETOPTS_MISSING_PARAM:
        printf("Parameter of `%s' is missing.\n", param);
        return (-1);
      case ARG_HELP:
        print_banner("kvh_client");
        print_usage();
        return (0);
      default:
        printf("Invalid or unknown parameter `%s'. "
             "Enter `kvh_client --help' for usage.\n", param);
        return (-1);
    }
  }

  if (!url) {
    printf("Url is missing. Enter `kvh_client --help' for usage.\n");
    return (-1);
  }
  if (params.empty()) {
    printf("Command is missing. Enter `kvh_client --help' for usage.\n");
    return (-1);
  }

  if (!quiet && verbose)
    print_banner("kvh_client");

  kvh_parameter_t dbparams[] = {
    { KVH_PARAM_TIMEOUT_MS, timeout },
    { KVH_PARAM_FLAGS, verbose ? KVH_VERBOSE : 0u },
    { 0, 0 }
  };

  kvhttp::db db;
  try {
    db.open(url, 0, &dbparams[0]);
  }
  catch (kvhttp::error &e) {
    error("db::open", e);
  }

  const std::string &command = params[0];

  if (command == "dump") {
    if (params.size() != 1) {
      printf("Too many parameters for `dump'.\n");
      return (-1);
    }
    return dump(db, scan, descend, begin, end);
  }

  if (command != "get" && command != "set" && command != "delete") {
    printf("Unknown command `%s'. Enter `kvh_client --help' for usage.\n",
           command.c_str());
    return (-1);
  }
  if (params.size() < 2 || params.size() > (command == "set" ? 3u : 2u)) {
    printf("Invalid number of parameters for `%s'.\n", command.c_str());
    return (-1);
  }
  const std::string &key = params[1];

  if (command == "get") {
    kvhttp::snapshot snap;
    try {
      snap = db.begin_snapshot();
      std::string value = snap.get(key);
      std::cout << value << std::endl;
      snap.discard();
    }
    catch (kvhttp::error &e) {
      release_session(snap);
      if (e.get_errno() == KVH_KEY_NOT_FOUND) {
        printf("Key `%s' not found\n", key.c_str());
        return (-1);
      }
      error("get", e);
    }
    return (0);
  }

  kvhttp::txn txn;
  try {
    txn = db.begin_transaction();
    if (command == "set") {
      if (params.size() == 3)
        txn.set(key, params[2]);
      else
        txn.set(key, &std::cin);
    }
    else
      txn.erase(key);
    txn.commit();
  }
  catch (kvhttp::error &e) {
    release_session(txn);
    error(command.c_str(), e);
  }

  return (0);
}
