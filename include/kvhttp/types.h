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
 * @file types.h
 * @brief Portable typedefs for kvhttp
 *
 */

#ifndef KVH_TYPES_H
#define KVH_TYPES_H

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Check the operating system
 */
#ifdef WIN32
#  undef  KVH_OS_WIN32
#  define KVH_OS_WIN32 1
#else /* posix? */
#  undef  KVH_OS_POSIX
#  define KVH_OS_POSIX 1
#endif

#if defined(KVH_OS_POSIX) && defined(KVH_OS_WIN32)
#  error "Unknown arch - neither KVH_OS_POSIX nor KVH_OS_WIN32 defined"
#endif

/*
 * Create the EXPORT macro for Microsoft Visual C++
 */
#ifndef KVH_EXPORT
#  ifdef _MSC_VER
#    define KVH_EXPORT __declspec(dllexport)
#  else
#    define KVH_EXPORT extern
#  endif
#endif

/*
 * The default calling convention is cdecl
 */
#ifndef KVH_CALLCONV
#  define KVH_CALLCONV
#endif

#include <stdint.h>

/**
 * typedef for error- and status-code
 */
typedef int                kvh_status_t;

#ifdef __cplusplus
} // extern "C"
#endif

#endif /* KVH_TYPES_H */
