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
#include "4txn/session.h"
#include "4cursor/cursor_remote.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

std::string
Session::get(context *ctx, const std::string &key)
{
  proto::GetRequest request;
  assign_session(&request);
  request.set_key(key);

  proto::GetResponse reply;
  invoker->call(ctx, path("get").c_str(), request, &reply);
  return reply.value();
}

RemoteCursor *
Session::ascend(const std::string &begin, const std::string &end)
{
  return new RemoteCursor(this, RemoteCursor::kAscend, begin, end);
}

RemoteCursor *
Session::descend(const std::string &begin, const std::string &end)
{
  return new RemoteCursor(this, RemoteCursor::kDescend, begin, end);
}

RemoteCursor *
Session::scan()
{
  return new RemoteCursor(this, RemoteCursor::kScan, "", "");
}

} // namespace kvhttp
