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

#include <curl/curl.h>

// Always verify that a file of level N does not include headers > N!
#include "1base/error.h"
#include "1base/util.h"
#include "2config/db_config.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

// owns a CURLU handle
struct UrlHandle {
  UrlHandle()
    : h(curl_url()) {
  }

  ~UrlHandle() {
    if (h)
      curl_url_cleanup(h);
  }

  // returns an url part; returns false if the part is not set
  bool get(CURLUPart what, std::string *value) {
    char *part = 0;
    if (curl_url_get(h, what, &part, 0) != CURLUE_OK)
      return false;
    *value = part;
    curl_free(part);
    return true;
  }

  CURLU *h;
};

void
DbConfig::set_url(const char *url)
{
  if (unlikely(!url || !*url)) {
    kvh_trace(("parameter 'url' must not be NULL or empty"));
    throw Exception(KVH_INV_PARAMETER, "url must not be empty");
  }

  UrlHandle u;
  if (unlikely(!u.h))
    throw Exception(KVH_INTERNAL_ERROR, "failed to create a curl url handle");

  CURLUcode uc = curl_url_set(u.h, CURLUPART_URL, url, 0);
  if (unlikely(uc != CURLUE_OK)) {
    kvh_trace(("invalid url '%s': %s", url, curl_url_strerror(uc)));
    throw Exception(KVH_INV_PARAMETER,
                    std::string("invalid url: ") + curl_url_strerror(uc));
  }

  std::string s, h, port, path;
  if (!u.get(CURLUPART_SCHEME, &s) || !u.get(CURLUPART_HOST, &h) || h.empty())
    throw Exception(KVH_INV_PARAMETER, std::string("invalid url: ") + url);

  s = util_to_lower(s);
  if (s != "http" && s != "https") {
    kvh_trace(("unsupported url scheme '%s'", s.c_str()));
    throw Exception(KVH_INV_PARAMETER, "url scheme must be http or https");
  }

  if (u.get(CURLUPART_PORT, &port))
    h += ":" + port;

  u.get(CURLUPART_PATH, &path);
  while (!path.empty() && path[path.size() - 1] == '/')
    path.erase(path.size() - 1);

  scheme = s;
  host = h;
  base_path = path;
}

void
DbConfig::apply_parameters(const kvh_parameter_t *param)
{
  for (const kvh_parameter_t *p = param; p && p->name; p++) {
    switch (p->name) {
      case KVH_PARAM_TIMEOUT_MS:
        timeout_ms = (uint32_t)p->value;
        break;
      case KVH_PARAM_CONNECT_TIMEOUT_MS:
        connect_timeout_ms = (uint32_t)p->value;
        break;
      case KVH_PARAM_FLAGS:
        if (unlikely(p->value & ~(uint64_t)KVH_VERBOSE)) {
          kvh_trace(("invalid flags 0x%llx",
                      (unsigned long long)p->value));
          throw Exception(KVH_INV_PARAMETER, "invalid flags");
        }
        flags = (uint32_t)p->value;
        break;
      default:
        kvh_trace(("unknown parameter %d", (int)p->name));
        throw Exception(KVH_INV_PARAMETER, "unknown parameter");
    }
  }
}

void
DbConfig::get_parameters(kvh_parameter_t *param) const
{
  for (kvh_parameter_t *p = param; p && p->name; p++) {
    switch (p->name) {
      case KVH_PARAM_TIMEOUT_MS:
        p->value = timeout_ms;
        break;
      case KVH_PARAM_CONNECT_TIMEOUT_MS:
        p->value = connect_timeout_ms;
        break;
      case KVH_PARAM_FLAGS:
        p->value = flags;
        break;
      default:
        kvh_trace(("unknown parameter %d", (int)p->name));
        throw Exception(KVH_INV_PARAMETER, "unknown parameter");
    }
  }
}

std::string
DbConfig::server_url() const
{
  return scheme + "://" + host + base_path;
}

std::string
DbConfig::endpoint_url(const char *subpath) const
{
  return server_url() + subpath;
}

} // namespace kvhttp
