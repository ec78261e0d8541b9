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

#ifndef KVH_SNAPSHOT_REMOTE_H
#define KVH_SNAPSHOT_REMOTE_H

#include "0root/root.h"

// Always verify that a file of level N does not include headers > N!
#include "4txn/session.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

//
// A remote, read-only Snapshot
//
struct RemoteSnapshot : Session {
  // Constructor; the Snapshot was already created on the server
  RemoteSnapshot(Invoker *invoker, const std::string &id)
    : Session(invoker, kSnapshot, id) {
  }

  // Discards the Snapshot
  void discard(context *ctx) {
    proto::DiscardRequest request;
    request.set_snapshot(id);

    proto::DiscardResponse reply;
    invoker->call(ctx, "/snap/discard", request, &reply);
  }
};

} // namespace kvhttp

#endif /* KVH_SNAPSHOT_REMOTE_H */
