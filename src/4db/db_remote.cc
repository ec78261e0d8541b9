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
#include "4db/db_remote.h"
#include "4txn/snapshot_remote.h"
#include "4txn/txn_remote.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

static DbConfig
make_config(const char *url, const kvh_parameter_t *param)
{
  DbConfig config;
  config.set_url(url);
  config.apply_parameters(param);
  return config;
}

RemoteDb::RemoteDb(const char *url, http_client *client_,
                const kvh_parameter_t *param)
  : config(make_config(url, param)), client(client_),
    invoker(&config, 0)
{
  if (!client) {
    owned_client.reset(new CurlClient(config.timeout_ms,
                            config.connect_timeout_ms,
                            ISSET(config.flags, KVH_VERBOSE)));
    client = owned_client.get();
  }
  invoker = Invoker(&config, client);
}

RemoteTxn *
RemoteDb::begin_transaction(context *ctx)
{
  std::string id = Uuid::generate();

  proto::NewTransactionRequest request;
  request.set_name(id);

  proto::NewTransactionResponse reply;
  invoker.call(ctx, "/new-transaction", request, &reply);
  return new RemoteTxn(&invoker, id);
}

RemoteSnapshot *
RemoteDb::begin_snapshot(context *ctx)
{
  std::string id = Uuid::generate();

  proto::NewSnapshotRequest request;
  request.set_name(id);

  proto::NewSnapshotResponse reply;
  invoker.call(ctx, "/new-snapshot", request, &reply);
  return new RemoteSnapshot(&invoker, id);
}

} // namespace kvhttp
