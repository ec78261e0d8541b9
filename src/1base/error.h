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
 * Error handling routines, logging facilities
 */

#ifndef KVH_ERROR_H
#define KVH_ERROR_H

#include "0root/root.h"

#include <string>

#include "kvhttp/kvhttp.h"

// Always verify that a file of level N does not include headers > N!

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

//
// A generic exception for storing a status code. |message| describes the
// failure; for errors reported by the server it is the server's text.
// |http_status| is set for KVH_TRANSPORT_ERROR if a reply was received.
//
struct Exception
{
  Exception(kvh_status_t st)
    : code(st), http_status(0) {
  }

  Exception(kvh_status_t st, const std::string &message_,
                  long http_status_ = 0)
    : code(st), message(message_), http_status(http_status_) {
  }

  kvh_status_t code;

  std::string message;

  long http_status;
};

// the default error handler
void KVH_CALLCONV
default_errhandler(int level, const char *message);

extern void
dbg_prepare(int level, const char *file, int line, const char *function,
                const char *expr);

extern void
dbg_log(const char *format, ...);

#ifndef NDEBUG
#  define kvh_trace(f)     do {                                               \
                kvhttp::dbg_prepare(KVH_DEBUG_LEVEL_DEBUG, __FILE__,          \
                    __LINE__, __FUNCTION__, 0);                               \
                kvhttp::dbg_log f;                                            \
              } while (0)
#else /* NDEBUG */
#   define kvh_trace(f)    (void)0
#endif /* NDEBUG */


#define kvh_log(f)       do {                                                 \
                kvhttp::dbg_prepare(KVH_DEBUG_LEVEL_NORMAL, __FILE__,         \
                    __LINE__, __FUNCTION__, 0);                               \
                kvhttp::dbg_log f;                                            \
              } while (0)

} // namespace kvhttp

#endif /* KVH_ERROR_H */
