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

/**
 * @file http_client.hpp
 *
 * The HTTP transport which is used by a kvhttp::db. kvhttp ships with a
 * libcurl-based implementation which is used if no other client is
 * specified. Applications can provide their own transport (i.e. to add
 * authentication headers, retries or a connection pool) by deriving from
 * kvhttp::http_client.
 */

#ifndef KVH_HTTP_CLIENT_HPP
#define KVH_HTTP_CLIENT_HPP

#include <string>

#include <kvhttp/kvhttp.h>

namespace kvhttp {

class context;

/**
 * The abstract HTTP transport.
 */
class http_client {
  public:
    /** Destructor */
    virtual ~http_client() {
    }

    /**
     * Sends a POST request with the given |body| to |url| and blocks till
     * the reply was received.
     *
     * The transport must observe |ctx| (which can be NULL): if the context
     * is cancelled, or its deadline expires, the request is aborted.
     *
     * @return 0 if a reply was received (regardless of its HTTP status);
     *      |http_status| and |reply_body| are then filled in.
     *      KVH_CANCELLED if the request was aborted because of |ctx|.
     *      KVH_TRANSPORT_ERROR if no reply was received.
     */
    virtual kvh_status_t post(context *ctx, const std::string &url,
                    const std::string &content_type, const std::string &body,
                    long *http_status, std::string *reply_body) = 0;
};

} // namespace kvhttp

#endif /* KVH_HTTP_CLIENT_HPP */
