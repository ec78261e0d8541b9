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
 * Semantic versioning for kvhttp
 *
 * @exception_safe: nothrow
 * @thread_safe: yes
 */

#ifndef KVH_VERSION_H
#define KVH_VERSION_H

#include "0root/root.h"

// Always verify that a file of level N does not include headers > N!

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

/*
 * The version numbers
 *
 * @remark A change of the major revision means a significant update
 * with a lot of new features and API changes.
 *
 * The minor version means a significant update without API changes, and the
 * revision is incremented for each release with minor improvements only.
 *
 * The wire protocol has no version number; client and server must agree
 * on the endpoints and the JSON field names (see messages.proto).
 */
#define KVH_VERSION_MAJ     1
#define KVH_VERSION_MIN     0
#define KVH_VERSION_REV     0
#define KVH_VERSION_STR     "1.0.0"

} // namespace kvhttp

#endif /* KVH_VERSION_H */
