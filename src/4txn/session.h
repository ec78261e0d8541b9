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
 * The common base of transactions and snapshots. A session is identified
 * by an id which is generated by the client; all state is kept on the
 * server.
 *
 * @exception_safe: strong
 * @thread_safe: no
 */

#ifndef KVH_SESSION_H
#define KVH_SESSION_H

#include "0root/root.h"

#include <string>

// Always verify that a file of level N does not include headers > N!
#include "3invoker/invoker.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

struct RemoteCursor;

struct Session
{
  enum {
    // a read/write transaction
    kTransaction = 0,

    // a read-only snapshot
    kSnapshot = 1
  };

  // Constructor
  Session(Invoker *invoker_, int kind_, const std::string &id_)
    : invoker(invoker_), kind(kind_), id(id_) {
  }

  // Destructor; does not contact the server
  virtual ~Session() {
  }

  // Returns the value of |key|
  std::string get(context *ctx, const std::string &key);

  // Creates a cursor over [begin, end) in ascending order; the cursor is
  // opened on the server with its first call to next()
  RemoteCursor *ascend(const std::string &begin, const std::string &end);

  // Creates a cursor over [begin, end) in descending order
  RemoteCursor *descend(const std::string &begin, const std::string &end);

  // Creates a cursor over all keys
  RemoteCursor *scan();

  // Returns the path of an endpoint of a session, i.e. "/tx/get"
  static std::string path(int kind, const char *operation) {
    return std::string(kind == kTransaction ? "/tx/" : "/snap/") + operation;
  }

  // Sets the session id in a request which has a transaction and a
  // snapshot field
  template<typename Request>
  static void assign_session(int kind, const std::string &id,
                  Request *request) {
    if (kind == kTransaction)
      request->set_transaction(id);
    else
      request->set_snapshot(id);
  }

  std::string path(const char *operation) const {
    return path(kind, operation);
  }

  template<typename Request>
  void assign_session(Request *request) const {
    assign_session(kind, id, request);
  }

  // the invoker of the database
  Invoker *invoker;

  // kTransaction or kSnapshot
  int kind;

  // the session id
  std::string id;
};

} // namespace kvhttp

#endif // KVH_SESSION_H
