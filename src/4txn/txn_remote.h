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

#ifndef KVH_TXN_REMOTE_H
#define KVH_TXN_REMOTE_H

#include "0root/root.h"

// Always verify that a file of level N does not include headers > N!
#include "4txn/session.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

//
// A remote Txn
//
struct RemoteTxn : Session {
  // Constructor; the Txn was already created on the server
  RemoteTxn(Invoker *invoker, const std::string &id)
    : Session(invoker, kTransaction, id) {
  }

  // Inserts or overwrites a key/value pair; throws KVH_INV_PARAMETER if
  // |value| is NULL
  void set(context *ctx, const std::string &key, const std::string *value);

  // Deletes a key
  void erase(context *ctx, const std::string &key);

  // Commits the Txn
  void commit(context *ctx);

  // Aborts the Txn
  void rollback(context *ctx);
};

} // namespace kvhttp

#endif /* KVH_TXN_REMOTE_H */
