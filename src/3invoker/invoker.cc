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

#include "kvhttp/kvhttp.hpp"

// Always verify that a file of level N does not include headers > N!
#include "1base/util.h"
#include "3invoker/invoker.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

static bool
is_missing(const std::string &s)
{
  return util_contains(s, "not found")
      || util_contains(s, "does not exist")
      || util_contains(s, "unknown");
}

kvh_status_t
Invoker::classify(const std::string &message)
{
  std::string s = util_to_lower(message);

  if (util_contains(s, "invalid argument"))
    return KVH_INV_PARAMETER;
  if ((util_contains(s, "iterator") || util_contains(s, "cursor"))
        && is_missing(s))
    return KVH_UNKNOWN_CURSOR;
  if ((util_contains(s, "transaction") || util_contains(s, "snapshot")
        || util_contains(s, "session"))
        && is_missing(s))
    return KVH_UNKNOWN_SESSION;
  if (util_contains(s, "not found") || util_contains(s, "does not exist"))
    return KVH_KEY_NOT_FOUND;
  return KVH_DOMAIN_ERROR;
}

void
Invoker::perform_request(context *ctx, const char *subpath,
                const google::protobuf::Message &request,
                google::protobuf::Message *reply)
{
  std::string url = m_config->endpoint_url(subpath);
  std::string body;
  Protocol::pack(request, &body);

  if (unlikely(ctx && ctx->is_cancelled())) {
    kvh_trace(("%s: context was cancelled", url.c_str()));
    throw Exception(KVH_CANCELLED, "context was cancelled");
  }

  kvh_trace(("POST %s %s", url.c_str(), body.c_str()));

  long http_status = 0;
  std::string reply_body;
  kvh_status_t st = m_client->post(ctx, url, KVH_CONTENT_TYPE, body,
                  &http_status, &reply_body);
  if (unlikely(st == KVH_CANCELLED)) {
    kvh_trace(("%s: request was cancelled", url.c_str()));
    throw Exception(KVH_CANCELLED, "request was cancelled");
  }
  if (unlikely(st != 0)) {
    kvh_log(("POST %s failed: %s", url.c_str(), kvh_strerror(st)));
    throw Exception(KVH_TRANSPORT_ERROR,
                    std::string("request failed: ") + kvh_strerror(st));
  }

  kvh_trace(("%s: HTTP %ld %s", url.c_str(), http_status,
                          reply_body.c_str()));

  if (unlikely(http_status < 200 || http_status > 299)) {
    char buffer[64];
    util_snprintf(buffer, sizeof(buffer),
                    "received non-ok http status %ld", http_status);
    kvh_log(("POST %s: %s", url.c_str(), buffer));
    throw Exception(KVH_TRANSPORT_ERROR, buffer, http_status);
  }

  if (unlikely(!Protocol::unpack(reply_body, reply))) {
    kvh_log(("POST %s: failed to decode the reply", url.c_str()));
    throw Exception(KVH_PROTOCOL_ERROR,
                    std::string("failed to decode reply of ") + subpath);
  }
}

} // namespace kvhttp
