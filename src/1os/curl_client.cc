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

#include <stdio.h>

#include <curl/curl.h>
#include <curl/easy.h>

#include <boost/thread/once.hpp>

#include "kvhttp/kvhttp.hpp"

// Always verify that a file of level N does not include headers > N!
#include "1base/cancel_state.h"
#include "1base/error.h"
#include "1os/curl_client.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

static boost::once_flag curl_init_flag = BOOST_ONCE_INIT;

static void
init_curl()
{
  CURLcode cc = curl_global_init(CURL_GLOBAL_ALL);
  if (cc)
    kvh_log(("curl_global_init failed: %d/%s", cc, curl_easy_strerror(cc)));
}

// the connection and DNS caches, shared by the easy handles of all requests
struct CurlShare {
  CurlShare()
    : handle(curl_share_init()) {
  }

  ~CurlShare() {
    if (handle)
      curl_share_cleanup(handle);
  }

  CURLSH *handle;

  // one lock per curl_lock_data
  Mutex locks[CURL_LOCK_DATA_LAST];
};

static void
lockfunc(CURL *, curl_lock_data data, curl_lock_access, void *ptr)
{
  CurlShare *share = (CurlShare *)ptr;
  share->locks[data].lock();
}

static void
unlockfunc(CURL *, curl_lock_data data, void *ptr)
{
  CurlShare *share = (CurlShare *)ptr;
  share->locks[data].unlock();
}

// releases the easy handle when leaving the scope
struct EasyHandle {
  EasyHandle()
    : curl(curl_easy_init()) {
  }

  ~EasyHandle() {
    if (curl)
      curl_easy_cleanup(curl);
  }

  CURL *curl;
};

// frees the header list when leaving the scope
struct HeaderList {
  HeaderList()
    : list(0) {
  }

  ~HeaderList() {
    if (list)
      curl_slist_free_all(list);
  }

  void append(const char *header) {
    list = curl_slist_append(list, header);
  }

  struct curl_slist *list;
};

static size_t
writefunc(char *buffer, size_t size, size_t nmemb, void *ptr)
{
  std::string *reply = (std::string *)ptr;
  reply->append(buffer, size * nmemb);
  return size * nmemb;
}

// called by curl while the request is in flight; a non-zero return value
// aborts the transfer with CURLE_ABORTED_BY_CALLBACK
static int
progressfunc(void *ptr, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
  CancelState *state = (CancelState *)ptr;
  return state && state->cancelled.load() ? 1 : 0;
}

#define SHARE_SETOPT(share, opt, val)                               \
          if ((sc = curl_share_setopt(share, opt, val))) {          \
            kvh_log(("curl_share_setopt failed: %d/%s", sc,         \
                     curl_share_strerror(sc)));                     \
            throw Exception(KVH_INTERNAL_ERROR,                     \
                            "failed to configure the curl share");  \
          }

#define SETOPT(curl, opt, val)                                      \
          if ((cc = curl_easy_setopt(curl, opt, val))) {            \
            kvh_log(("curl_easy_setopt failed: %d/%s", cc,          \
                     curl_easy_strerror(cc)));                      \
            return KVH_INTERNAL_ERROR;                              \
          }

CurlClient::CurlClient(uint32_t timeout_ms, uint32_t connect_timeout_ms,
                bool verbose)
  : m_timeout_ms(timeout_ms), m_connect_timeout_ms(connect_timeout_ms),
    m_verbose(verbose)
{
  boost::call_once(curl_init_flag, init_curl);

  m_share.reset(new CurlShare);
  if (unlikely(!m_share->handle)) {
    kvh_log(("curl_share_init failed"));
    throw Exception(KVH_INTERNAL_ERROR, "failed to create a curl share");
  }

  CURLSH *share = m_share->handle;
  CURLSHcode sc;
  SHARE_SETOPT(share, CURLSHOPT_LOCKFUNC, lockfunc);
  SHARE_SETOPT(share, CURLSHOPT_UNLOCKFUNC, unlockfunc);
  SHARE_SETOPT(share, CURLSHOPT_USERDATA, m_share.get());
  SHARE_SETOPT(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
  SHARE_SETOPT(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
}

CurlClient::~CurlClient()
{
}

kvh_status_t
CurlClient::post(context *ctx, const std::string &url,
                const std::string &content_type, const std::string &body,
                long *http_status, std::string *reply_body)
{
  CancelState *state = ctx ? ctx->get_handle() : 0;
  CURLcode cc;
  char header[256];
  HeaderList headers;

  if (state && state->is_cancelled())
    return KVH_CANCELLED;

  EasyHandle easy;
  if (unlikely(!easy.curl)) {
    kvh_log(("curl_easy_init failed"));
    return KVH_INTERNAL_ERROR;
  }
  CURL *curl = easy.curl;

  // the total timeout is the shorter one of the configured timeout and
  // the context's deadline
  long timeout_ms = (long)m_timeout_ms;
  long remaining = state ? state->remaining_millis() : -1;
  if (remaining > 0 && (timeout_ms == 0 || remaining < timeout_ms))
    timeout_ms = remaining;

  snprintf(header, sizeof(header), "Content-Type: %s", content_type.c_str());
  headers.append(header);
  headers.append("Expect:");

  reply_body->clear();

  SETOPT(curl, CURLOPT_SHARE, m_share->handle);
  SETOPT(curl, CURLOPT_VERBOSE, m_verbose ? 1L : 0L);
  SETOPT(curl, CURLOPT_NOSIGNAL, 1L);
  SETOPT(curl, CURLOPT_URL, url.c_str());
  SETOPT(curl, CURLOPT_POST, 1L);
  SETOPT(curl, CURLOPT_POSTFIELDS, body.data());
  SETOPT(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body.size());
  SETOPT(curl, CURLOPT_HTTPHEADER, headers.list);
  SETOPT(curl, CURLOPT_WRITEFUNCTION, writefunc);
  SETOPT(curl, CURLOPT_WRITEDATA, reply_body);
  SETOPT(curl, CURLOPT_NOPROGRESS, 0L);
  SETOPT(curl, CURLOPT_XFERINFOFUNCTION, progressfunc);
  SETOPT(curl, CURLOPT_XFERINFODATA, state);
  SETOPT(curl, CURLOPT_CONNECTTIMEOUT_MS, (long)m_connect_timeout_ms);
  SETOPT(curl, CURLOPT_TIMEOUT_MS, timeout_ms);

  cc = curl_easy_perform(curl);

  if (cc == CURLE_ABORTED_BY_CALLBACK)
    return KVH_CANCELLED;
  if (cc == CURLE_OPERATION_TIMEDOUT && state && state->is_cancelled())
    return KVH_CANCELLED;
  if (cc) {
    kvh_log(("network transmission to %s failed: %s", url.c_str(),
                curl_easy_strerror(cc)));
    return KVH_TRANSPORT_ERROR;
  }

  long response = 0;
  cc = curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response);
  if (cc) {
    kvh_log(("network transmission to %s failed: %s", url.c_str(),
                curl_easy_strerror(cc)));
    return KVH_TRANSPORT_ERROR;
  }

  *http_status = response;
  return 0;
}

} // namespace kvhttp
