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

#include <set>
#include <string>

#include <catch2/catch.hpp>

#include "1base/cancel_state.h"
#include "1base/uuid.h"
#include "1os/curl_client.h"

#include "utils.h"

using namespace kvhttp;

TEST_CASE("Misc/uuidTest", "")
{
  std::set<std::string> ids;
  for (int i = 0; i < 100; i++) {
    std::string id = Uuid::generate();
    REQUIRE(id.size() == 36u);
    REQUIRE(id[8] == '-');
    REQUIRE(id[13] == '-');
    REQUIRE(id[18] == '-');
    REQUIRE(id[23] == '-');
    // version 4
    REQUIRE(id[14] == '4');
    ids.insert(id);
  }
  REQUIRE(ids.size() == 100u);
}

TEST_CASE("Misc/contextTest", "")
{
  context ctx;
  REQUIRE(!ctx.is_cancelled());
  REQUIRE(ctx.get_remaining_millis() == -1);

  ctx.set_timeout(100000);
  long remaining = ctx.get_remaining_millis();
  REQUIRE(remaining > 0);
  REQUIRE(remaining <= 100000);
  REQUIRE(!ctx.is_cancelled());

  ctx.cancel();
  REQUIRE(ctx.is_cancelled());
  REQUIRE(ctx.get_handle()->cancelled.load());
}

TEST_CASE("Misc/contextDeadlineTest", "")
{
  context ctx;
  ctx.set_timeout(0);
  REQUIRE(ctx.get_remaining_millis() == 0);
  REQUIRE(ctx.is_cancelled());
}

TEST_CASE("Misc/curlCancelledTest", "")
{
  CurlClient client(0, 1000, false);
  context ctx;
  ctx.cancel();

  long status = 0;
  std::string reply;
  // fails without sending the request
  REQUIRE(KVH_CANCELLED == client.post(&ctx, "http://127.0.0.1:1/db/tx/get",
                          KVH_CONTENT_TYPE, "{}", &status, &reply));
  REQUIRE(status == 0);
}

TEST_CASE("Misc/curlConnectionRefusedTest", "")
{
  CurlClient client(5000, 2000, false);

  long status = 0;
  std::string reply;
  REQUIRE(KVH_TRANSPORT_ERROR == client.post(0,
                          "http://127.0.0.1:1/db/tx/get",
                          KVH_CONTENT_TYPE, "{}", &status, &reply));
}
