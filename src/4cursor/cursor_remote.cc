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
#include "1base/uuid.h"
#include "4cursor/cursor_remote.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

RemoteCursor::RemoteCursor(const Session *session_, int direction_,
                const std::string &begin_, const std::string &end_)
  : invoker(session_->invoker), session_kind(session_->kind),
    session_id(session_->id), direction(direction_), begin(begin_),
    end(end_), id(Uuid::generate()), state(kUnopened)
{
}

void
RemoteCursor::open(context *ctx)
{
  if (direction == kScan) {
    proto::ScanRequest request;
    Session::assign_session(session_kind, session_id, &request);
    request.set_name(id);

    proto::ScanResponse reply;
    invoker->call(ctx, Session::path(session_kind, "scan").c_str(), request,
                    &reply);
    return;
  }

  proto::RangeRequest request;
  Session::assign_session(session_kind, session_id, &request);
  request.set_name(id);
  request.set_begin(begin);
  request.set_end(end);

  proto::RangeResponse reply;
  invoker->call(ctx,
                  Session::path(session_kind, direction == kAscend
                                  ? "ascend"
                                  : "descend").c_str(),
                  request, &reply);
}

bool
RemoteCursor::next(context *ctx, std::string *key, std::string *value)
{
  if (state == kExhausted || state == kFailed)
    return false;

  try {
    if (state == kUnopened) {
      open(ctx);
      state = kOpen;
    }

    proto::NextRequest request;
    request.set_iterator(id);

    proto::NextResponse reply;
    invoker->call(ctx, "/it/next", request, &reply);

    // an empty key is the end of the range
    if (reply.key().empty()) {
      state = kExhausted;
      return false;
    }

    key->swap(*reply.mutable_key());
    value->swap(*reply.mutable_value());
    return true;
  }
  catch (Exception &) {
    state = kFailed;
    throw;
  }
}

} // namespace kvhttp
