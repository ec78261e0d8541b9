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
 * The Invoker sends a single request to the server and decodes the reply.
 *
 * Failures are thrown as Exception:
 *  - KVH_CANCELLED if the context was cancelled or its deadline expired
 *  - KVH_TRANSPORT_ERROR if no reply was received, or the HTTP status
 *    was not 2xx (then Exception::http_status is set)
 *  - KVH_PROTOCOL_ERROR if the reply body cannot be decoded
 *  - a domain error (see classify()) if the reply has a non-empty
 *    error field
 *
 * Nothing is retried.
 *
 * @exception_safe: strong
 * @thread_safe: no
 */

#ifndef KVH_INVOKER_H
#define KVH_INVOKER_H

#include "0root/root.h"

#include <string>

#include "kvhttp/http_client.hpp"

// Always verify that a file of level N does not include headers > N!
#include "1base/error.h"
#include "2config/db_config.h"
#include "2protobuf/protocol.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

class Invoker
{
  public:
    // Constructor; |config| and |client| are borrowed
    Invoker(const DbConfig *config, http_client *client)
      : m_config(config), m_client(client) {
    }

    // Sends |request| to |subpath| (i.e. "/tx/get") and decodes the
    // reply into |reply|; throws if the server reported an error
    template<typename Reply>
    void call(context *ctx, const char *subpath,
                    const google::protobuf::Message &request, Reply *reply) {
      perform_request(ctx, subpath, request, reply);
      if (unlikely(!reply->error().empty())) {
        kvh_trace(("%s failed: %s", subpath, reply->error().c_str()));
        throw Exception(classify(reply->error()), reply->error());
      }
    }

    // Sends |request| to |subpath| and decodes the reply into |reply|;
    // does not inspect the error field of the reply
    void perform_request(context *ctx, const char *subpath,
                    const google::protobuf::Message &request,
                    google::protobuf::Message *reply);

    // Maps the error string of the server to a status code
    static kvh_status_t classify(const std::string &message);

  private:
    // the configuration of the database
    const DbConfig *m_config;

    // the HTTP transport
    http_client *m_client;
};

} // namespace kvhttp

#endif // KVH_INVOKER_H
