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

#include <ctype.h>

// Always verify that a file of level N does not include headers > N!
#include "1base/util.h"

namespace kvhttp {

int
util_vsnprintf(char *str, size_t size, const char *format, va_list ap)
{
#if defined(KVH_OS_POSIX)
  return vsnprintf(str, size, format, ap);
#else
  return _vsnprintf(str, size, format, ap);
#endif
}

std::string
util_to_lower(const std::string &s)
{
  std::string r(s);
  for (std::string::iterator it = r.begin(); it != r.end(); ++it)
    *it = (char)::tolower((unsigned char)*it);
  return r;
}

} // namespace kvhttp
