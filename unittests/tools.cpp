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

#include <catch2/catch.hpp>

#include "common.h"

#include "fake_server.h"
#include "utils.h"

using namespace kvhttp;

struct ToolsFixture {
  FakeServer server;
  db m_db;

  ToolsFixture()
    : m_db(FAKE_SERVER_URL, &server) {
    server.data["a"] = "1";
  }

  void failedGetReleasesSnapshotTest() {
    snapshot snap = m_db.begin_snapshot();
    REQUIRE_CATCH(snap.get("missing"), KVH_KEY_NOT_FOUND);
    REQUIRE(server.snapshots.size() == 1u);

    release_session(snap);
    REQUIRE(server.snapshots.empty());
    REQUIRE(server.request_count("/snap/discard") == 1u);
  }

  void failedSetRollsBackTest() {
    txn t = m_db.begin_transaction();
    t.set("b", "2");
    REQUIRE_CATCH(t.set("", "x"), KVH_INV_PARAMETER);
    REQUIRE(server.txns.size() == 1u);

    release_session(t);
    REQUIRE(server.txns.empty());
    REQUIRE(server.request_count("/tx/rollback") == 1u);

    // nothing was committed
    REQUIRE(server.data.size() == 1u);
    REQUIRE(server.data.find("b") == server.data.end());
  }

  void unstartedSessionTest() {
    snapshot snap;
    txn t;
    release_session(snap);
    release_session(t);
    REQUIRE(server.request_count() == 0u);
  }

  void closedSessionTest() {
    txn t = m_db.begin_transaction();
    t.commit();

    // the server no longer knows the transaction; this does not throw
    release_session(t);
    REQUIRE(server.request_count("/tx/rollback") == 1u);

    snapshot snap = m_db.begin_snapshot();
    snap.discard();
    release_session(snap);
    REQUIRE(server.request_count("/snap/discard") == 2u);
  }
};

TEST_CASE("Tools/failedGetReleasesSnapshotTest", "")
{
  ToolsFixture f;
  f.failedGetReleasesSnapshotTest();
}

TEST_CASE("Tools/failedSetRollsBackTest", "")
{
  ToolsFixture f;
  f.failedSetRollsBackTest();
}

TEST_CASE("Tools/unstartedSessionTest", "")
{
  ToolsFixture f;
  f.unstartedSessionTest();
}

TEST_CASE("Tools/closedSessionTest", "")
{
  ToolsFixture f;
  f.closedSessionTest();
}
