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
 * The default HTTP transport, based on libcurl. Throws exceptions if the
 * curl handle cannot be created.
 *
 * Every request uses its own curl easy handle, therefore requests of
 * several threads run in parallel. The handles share curl's connection
 * cache and DNS cache, and the connection to the server is reused between
 * requests. The share lock is only held while curl accesses the caches,
 * never for the duration of a request.
 *
 * @exception_safe: basic
 * @thread_safe: yes
 */

#ifndef KVH_CURL_CLIENT_H
#define KVH_CURL_CLIENT_H

#include "0root/root.h"

#include <string>

#include <boost/scoped_ptr.hpp>

#include "kvhttp/http_client.hpp"

// Always verify that a file of level N does not include headers > N!
#include "1base/mutex.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

struct CurlShare;

class CurlClient : public http_client
{
  public:
    // Constructor; a |timeout_ms| of 0 disables the request timeout
    CurlClient(uint32_t timeout_ms, uint32_t connect_timeout_ms,
                    bool verbose);

    // Destructor; closes the cached connections
    virtual ~CurlClient();

    // Sends a POST request; blocks till the reply was received. Can be
    // called by several threads at the same time
    virtual kvh_status_t post(context *ctx, const std::string &url,
                    const std::string &content_type, const std::string &body,
                    long *http_status, std::string *reply_body);

  private:
    // the caches which are shared by all requests
    boost::scoped_ptr<CurlShare> m_share;

    // the request timeout, in milliseconds; 0 if disabled
    uint32_t m_timeout_ms;

    // the connection timeout, in milliseconds
    uint32_t m_connect_timeout_ms;

    // enables curl's verbose output
    bool m_verbose;
};

} // namespace kvhttp

#endif /* KVH_CURL_CLIENT_H */
