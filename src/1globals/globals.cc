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

#include "0root/root.h"

// Always verify that a file of level N does not include headers > N!
#include "1globals/globals.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

thread_local int Globals::ms_error_level;

thread_local const char *Globals::ms_error_file;

thread_local int Globals::ms_error_line;

thread_local const char *Globals::ms_error_expr;

thread_local const char *Globals::ms_error_function;

kvh_error_handler_fun Globals::ms_error_handler = default_errhandler;

} // namespace kvhttp
