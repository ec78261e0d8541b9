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
 * @file kvhttp.h
 * @version 1.0.0
 *
 * Status codes, parameters and static functions of the kvhttp client
 * library. The objects of the library (databases, transactions, snapshots
 * and cursors) are available through the C++ API in kvhttp.hpp.
 *
 * kvhttp talks to a transactional key/value server over HTTP. Every
 * operation is a single POST request with a JSON body. Transactions,
 * snapshots and cursors live on the server and are referenced by ids which
 * are generated on the client.
 */

#ifndef KVH_KVHTTP_H
#define KVH_KVHTTP_H

#include <kvhttp/types.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * A named parameter; used when creating a database handle.
 *
 * The parameter list is terminated by an element with name 0.
 */
typedef struct {
  /** The name of the parameter; one of the KVH_PARAM_* constants */
  uint32_t name;

  /** The value of the parameter */
  uint64_t value;

} kvh_parameter_t;

/**
 * @defgroup kvh_status_codes kvhttp Status Codes
 * @{
 */

/** Operation completed successfully */
#define KVH_SUCCESS                     (  0)
/** Invalid function parameter, or the server rejected an argument */
#define KVH_INV_PARAMETER               ( -8)
/** Key was not found */
#define KVH_KEY_NOT_FOUND               (-11)
/** Internal kvhttp error */
#define KVH_INTERNAL_ERROR              (-14)
/** Failed to read a value stream */
#define KVH_IO_ERROR                    (-18)
/** Network error, or the server replied with a non-success HTTP status */
#define KVH_TRANSPORT_ERROR             (-400)
/** The operation was cancelled or its deadline expired */
#define KVH_CANCELLED                   (-401)
/** The server reply could not be decoded */
#define KVH_PROTOCOL_ERROR              (-402)
/** The server reported an error */
#define KVH_DOMAIN_ERROR                (-403)
/** The server does not know the transaction or snapshot */
#define KVH_UNKNOWN_SESSION             (-404)
/** The server does not know the cursor */
#define KVH_UNKNOWN_CURSOR              (-405)

/**
 * @}
 */

/**
 * @defgroup kvh_parameters kvhttp Parameters
 * @{
 */

/** Parameter name for the total timeout of a request, in milliseconds;
 * 0 (the default) disables the timeout */
#define KVH_PARAM_TIMEOUT_MS            0x00000100

/** Parameter name for the connection timeout, in milliseconds */
#define KVH_PARAM_CONNECT_TIMEOUT_MS    0x00000101

/** Parameter name for the database flags */
#define KVH_PARAM_FLAGS                 0x00000200

/** Flag for KVH_PARAM_FLAGS: the HTTP client prints verbose output */
#define KVH_VERBOSE                     0x00000001

/**
 * @}
 */

/**
 * @defgroup kvh_static kvhttp Static Functions
 * @{
 */

/**
 * A typedef for a custom error handler function
 *
 * @param level The error level:
 *    <ul>
 *     <li>@ref KVH_DEBUG_LEVEL_DEBUG (0) </li> a debug message
 *     <li>@ref KVH_DEBUG_LEVEL_NORMAL (1) </li> a normal error message
 *     <li>2</li> reserved
 *     <li>@ref KVH_DEBUG_LEVEL_FATAL (3) </li> a fatal error message
 *    </ul>
 * @param message The error message
 */
typedef void KVH_CALLCONV (*kvh_error_handler_fun)(int level,
                const char *message);

/** A debug message */
#define KVH_DEBUG_LEVEL_DEBUG     0

/** A normal error message */
#define KVH_DEBUG_LEVEL_NORMAL    1

/** A fatal error message */
#define KVH_DEBUG_LEVEL_FATAL     3

/**
 * Sets the global error handler
 *
 * This handler will receive all messages that are emitted by kvhttp,
 * including the traces of each request in debug builds. The default handler
 * prints the messages to stderr.
 *
 * @param f A pointer to the error handler function, or NULL to restore
 *      the default handler
 */
KVH_EXPORT void KVH_CALLCONV
kvh_set_error_handler(kvh_error_handler_fun f);

/**
 * Translates a kvhttp status code to a descriptive error string
 *
 * @param status The kvhttp status code
 *
 * @return A pointer to a descriptive error string
 */
KVH_EXPORT const char * KVH_CALLCONV
kvh_strerror(kvh_status_t status);

/**
 * Returns true if the status code was reported by the server (and not
 * by the transport or by the client library)
 */
KVH_EXPORT int KVH_CALLCONV
kvh_is_domain_error(kvh_status_t status);

/**
 * Returns the version of the kvhttp library
 *
 * @param major If not NULL, will return the major version number
 * @param minor If not NULL, will return the minor version number
 * @param revision If not NULL, will return the revision version number
 */
KVH_EXPORT void KVH_CALLCONV
kvh_get_version(uint32_t *major, uint32_t *minor, uint32_t *revision);

/**
 * @}
 */

#ifdef __cplusplus
} // extern "C"
#endif

#endif /* KVH_KVHTTP_H */
