/*
 * Copyright (C) 2005-2016 Christoph Rupp (chris@crupp.de).
 * All Rights Reserved.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * See the file COPYING for License information.
 */

#ifndef KVH_UNITTESTS_UTILS_H
#define KVH_UNITTESTS_UTILS_H

#include "0root/root.h"

#include "1base/error.h"
#include "kvhttp/kvhttp.hpp"

// runs |x| and requires that it throws a kvhttp::error with status |y|
#define REQUIRE_CATCH(x, y)                                                   \
        do {                                                                  \
          kvh_status_t st_ = 0;                                               \
          try { x; } catch (kvhttp::error &ex) { st_ = ex.get_errno(); }      \
          REQUIRE(st_ == (y));                                                \
        } while (0)

// runs |x| and requires that it throws a kvhttp::Exception with status |y|
#define REQUIRE_EXCEPTION(x, y)                                               \
        do {                                                                  \
          kvh_status_t st_ = 0;                                               \
          try { x; } catch (kvhttp::Exception &ex) { st_ = ex.code; }         \
          REQUIRE(st_ == (y));                                                \
        } while (0)

#endif // KVH_UNITTESTS_UTILS_H
