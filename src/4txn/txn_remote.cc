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
#include "4txn/txn_remote.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

void
RemoteTxn::set(context *ctx, const std::string &key, const std::string *value)
{
  if (unlikely(!value)) {
    kvh_trace(("parameter 'value' must not be NULL"));
    throw Exception(KVH_INV_PARAMETER, "value must not be NULL");
  }

  proto::SetRequest request;
  request.set_transaction(id);
  request.set_key(key);
  request.set_value(*value);

  proto::SetResponse reply;
  invoker->call(ctx, "/tx/set", request, &reply);
}

void
RemoteTxn::erase(context *ctx, const std::string &key)
{
  proto::DeleteRequest request;
  request.set_transaction(id);
  request.set_key(key);

  proto::DeleteResponse reply;
  invoker->call(ctx, "/tx/delete", request, &reply);
}

void
RemoteTxn::commit(context *ctx)
{
  proto::CommitRequest request;
  request.set_transaction(id);

  proto::CommitResponse reply;
  invoker->call(ctx, "/tx/commit", request, &reply);
}

void
RemoteTxn::rollback(context *ctx)
{
  proto::RollbackRequest request;
  request.set_transaction(id);

  proto::RollbackResponse reply;
  invoker->call(ctx, "/tx/rollback", request, &reply);
}

} // namespace kvhttp
