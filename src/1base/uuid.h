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
 * Generates the client-side ids of transactions, snapshots and cursors
 *
 * @exception_safe: strong
 * @thread_safe: yes
 */

#ifndef KVH_UUID_H
#define KVH_UUID_H

#include "0root/root.h"

#include <string>

// Always verify that a file of level N does not include headers > N!

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

struct Uuid {
  // Returns a random (version 4) UUID in its canonical 36-character form,
  // i.e. "0b5d5c2a-8a4b-4cc6-9d3e-2f1c6a0f9e11"
  static std::string generate();
};

} // namespace kvhttp

#endif // KVH_UUID_H
