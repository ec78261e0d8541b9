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
 * Implementation for remote cursors
 *
 * The iteration state is kept on the server, identified by the cursor id.
 * The cursor is opened with the first call to next(); every call to next()
 * is one round trip. The server signals the end of the range with an
 * empty key. There is no request to close a cursor.
 *
 *   kUnopened --next()--> kOpen --next()--> kExhausted
 *       |                   |
 *       +--(error)----------+--(error)----> kFailed
 *
 * In kExhausted and kFailed next() returns false without contacting the
 * server.
 *
 * @exception_safe: basic
 * @thread_safe: no
 */

#ifndef KVH_CURSOR_REMOTE_H
#define KVH_CURSOR_REMOTE_H

#include "0root/root.h"

#include <string>

// Always verify that a file of level N does not include headers > N!
#include "4txn/session.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

struct RemoteCursor {
  enum {
    kAscend = 0,
    kDescend = 1,
    kScan = 2
  };

  enum {
    kUnopened = 0,
    kOpen = 1,
    kExhausted = 2,
    kFailed = 3
  };

  // Constructor; assigns a new cursor id, but does not contact the server.
  // Copies the invoker and the id of |session|; the session object can
  // be destroyed before the cursor.
  RemoteCursor(const Session *session, int direction,
                  const std::string &begin, const std::string &end);

  // Retrieves the next entry; returns false at the end of the range.
  // Throws if the cursor cannot be opened, or the server reports an
  // error; the cursor then moves to kFailed.
  bool next(context *ctx, std::string *key, std::string *value);

  // the invoker of the database
  Invoker *invoker;

  // Session::kTransaction or Session::kSnapshot
  int session_kind;

  // the id of the session which created this cursor
  std::string session_id;

  // kAscend, kDescend or kScan
  int direction;

  // the lower bound (inclusive); empty if unlimited
  std::string begin;

  // the upper bound (exclusive); empty if unlimited
  std::string end;

  // the cursor id
  std::string id;

  // kUnopened, kOpen, kExhausted or kFailed
  int state;

 private:
  // Opens the cursor on the server
  void open(context *ctx);
};

} // namespace kvhttp

#endif /* KVH_CURSOR_REMOTE_H */
