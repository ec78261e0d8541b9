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
 * The configuration settings of a Database: the normalized endpoint and
 * the settings of the HTTP transport.
 *
 * @exception_safe strong
 * @thread_safe no
 */

#ifndef KVH_DB_CONFIG_H
#define KVH_DB_CONFIG_H

#include "0root/root.h"

#include <string>

#include "kvhttp/kvhttp.h"

// Always verify that a file of level N does not include headers > N!

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

struct DbConfig
{
  // Constructor initializes with default values
  DbConfig()
    : flags(0), timeout_ms(0),
      connect_timeout_ms(KVH_DEFAULT_CONNECT_TIMEOUT_MS) {
  }

  // Parses and normalizes |url|; only scheme, host, port and path are
  // kept, credentials, query string and fragment are dropped. Throws
  // KVH_INV_PARAMETER if the url is not a valid http(s) url.
  void set_url(const char *url);

  // Applies a parameter list (terminated by a parameter with name 0).
  // Throws KVH_INV_PARAMETER for unknown parameters.
  void apply_parameters(const kvh_parameter_t *param);

  // Fills in the values of a parameter list. Throws KVH_INV_PARAMETER for
  // unknown parameters.
  void get_parameters(kvh_parameter_t *param) const;

  // Returns the normalized base url, i.e. "http://localhost:8080/db"
  std::string server_url() const;

  // Returns the url of an endpoint; |subpath| starts with a '/'
  std::string endpoint_url(const char *subpath) const;

  // the url scheme; "http" or "https"
  std::string scheme;

  // the host, including the port (if one was specified)
  std::string host;

  // the base path without trailing '/'; can be empty
  std::string base_path;

  // the database's flags (KVH_VERBOSE)
  uint32_t flags;

  // the total timeout of a request (in milliseconds); 0 means no timeout
  uint32_t timeout_ms;

  // the connection timeout (in milliseconds)
  uint32_t connect_timeout_ms;
};

} // namespace kvhttp

#endif // KVH_DB_CONFIG_H
