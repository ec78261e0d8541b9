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

#include "0root/root.h"

#include "1base/error.h"
#include "2protobuf/protocol.h"

#define CATCH_CONFIG_RUNNER 1
#include <catch2/catch.hpp>

// only print fatal messages while the tests are running; many tests
// trigger errors on purpose
static void KVH_CALLCONV
quiet_errhandler(int level, const char *message)
{
  if (level >= KVH_DEBUG_LEVEL_FATAL)
    kvhttp::default_errhandler(level, message);
}

int
main(int argc, char *argv[])
{
  kvh_set_error_handler(quiet_errhandler);

  Catch::Session session;
  int result = session.run(argc, argv);

  kvhttp::Protocol::shutdown();
  Catch::cleanUp();

  return result;
}
