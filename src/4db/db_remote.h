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

#ifndef KVH_DB_REMOTE_H
#define KVH_DB_REMOTE_H

#include "0root/root.h"

#include <string>

#include <boost/scoped_ptr.hpp>

// Always verify that a file of level N does not include headers > N!
#include "1os/curl_client.h"
#include "2config/db_config.h"
#include "3invoker/invoker.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

struct RemoteTxn;
struct RemoteSnapshot;

/*
 * The database implementation for remote access. It owns the
 * configuration and the transport, but no per-session state.
 */
struct RemoteDb
{
  // Constructor; validates the url and applies the parameters. Does not
  // contact the server. If |client| is NULL then a CurlClient is created.
  RemoteDb(const char *url, http_client *client,
                  const kvh_parameter_t *param);

  // Begins a new Txn (/new-transaction)
  RemoteTxn *begin_transaction(context *ctx);

  // Begins a new Snapshot (/new-snapshot)
  RemoteSnapshot *begin_snapshot(context *ctx);

  // Returns the normalized base url
  std::string server_url() const {
    return config.server_url();
  }

  // the configuration settings
  DbConfig config;

  // the CurlClient, if no client was supplied by the caller
  boost::scoped_ptr<CurlClient> owned_client;

  // the HTTP transport
  http_client *client;

  // sends the requests
  Invoker invoker;
};

} // namespace kvhttp

#endif /* KVH_DB_REMOTE_H */
