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

/*
 * Global variables; used by the logging facility
 */

#ifndef KVH_GLOBALS_H
#define KVH_GLOBALS_H

#include "0root/root.h"

#include "kvhttp/kvhttp.h"

// Always verify that a file of level N does not include headers > N!
#include "1base/error.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

struct Globals {
  // used in error.h/error.cc; one copy per thread, since requests are
  // traced from the caller's thread
  static thread_local int ms_error_level;

  // used in error.h/error.cc
  static thread_local const char *ms_error_file;

  // used in error.h/error.cc
  static thread_local int ms_error_line;

  // used in error.h/error.cc
  static thread_local const char *ms_error_expr;

  // used in error.h/error.cc
  static thread_local const char *ms_error_function;

  // the installed error handler; set once at startup
  static kvh_error_handler_fun ms_error_handler;
};

} // namespace kvhttp

#endif // KVH_GLOBALS_H
