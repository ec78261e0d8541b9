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

#ifndef KVH_TOOLS_COMMON_H
#define KVH_TOOLS_COMMON_H

#ifdef __cplusplus
extern "C" {
#endif

/*
 * prints a welcome banner
 */
extern void
print_banner(const char *program_name);

#ifdef __cplusplus
} // extern "C"
#endif

#ifdef __cplusplus

#include <kvhttp/kvhttp.hpp>

/*
 * discards a snapshot after a failed command; the server would otherwise
 * keep it till it times out. Does nothing if |snap| was not started.
 */
extern void
release_session(kvhttp::snapshot &snap);

/*
 * rolls back a transaction after a failed command
 */
extern void
release_session(kvhttp::txn &txn);

#endif // __cplusplus

#endif /* KVH_TOOLS_COMMON_H */
