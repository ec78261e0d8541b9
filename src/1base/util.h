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
 * Misc. utility functions
 *
 * @exception_safe: nothrow
 * @thread_safe: yes
 */

#ifndef KVH_UTIL_H
#define KVH_UTIL_H

#include "0root/root.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#include <string>

// Always verify that a file of level N does not include headers > N!

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

//
// vsnprintf replacement/wrapper
//
// uses _vsnprintf on Win32
//
extern int
util_vsnprintf(char *str, size_t size, const char *format, va_list ap);

//
// snprintf replacement/wrapper
//
#ifndef KVH_OS_POSIX
#  define util_snprintf _snprintf
#else
#  define util_snprintf snprintf
#endif

//
// Returns a lower-case copy of |s| (ASCII only)
//
extern std::string
util_to_lower(const std::string &s);

//
// Returns true if |haystack| contains |needle|
//
static inline bool
util_contains(const std::string &haystack, const char *needle)
{
  return haystack.find(needle) != std::string::npos;
}

} // namespace kvhttp

#endif // KVH_UTIL_H
