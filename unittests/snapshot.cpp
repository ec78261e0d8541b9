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

#include "fake_server.h"
#include "utils.h"

using namespace kvhttp;

struct SnapshotFixture {
  FakeServer server;
  db m_db;

  SnapshotFixture()
    : m_db(FAKE_SERVER_URL, &server) {
    server.data["a"] = "1";
    server.data["b"] = "2";
  }

  void getTest() {
    snapshot s = m_db.begin_snapshot();
    REQUIRE(s.get("a") == "1");
    REQUIRE(s.get("b") == "2");
    REQUIRE(server.paths[1] == "/snap/get");
    REQUIRE(server.bodies[1].find("\"Snapshot\"") != std::string::npos);
    REQUIRE(server.bodies[1].find("\"Transaction\"") == std::string::npos);
  }

  void missingKeyTest() {
    snapshot s = m_db.begin_snapshot();
    REQUIRE_CATCH(s.get("missing"), KVH_KEY_NOT_FOUND);
    s.discard();
    REQUIRE_CATCH(s.get("a"), KVH_UNKNOWN_SESSION);
    REQUIRE(server.snapshots.empty());
  }

  void isolationTest() {
    snapshot s = m_db.begin_snapshot();

    txn t = m_db.begin_transaction();
    t.set("a", "changed");
    t.set("c", "3");
    t.commit();

    // the snapshot does not see the later commit
    REQUIRE(s.get("a") == "1");
    REQUIRE_CATCH(s.get("c"), KVH_KEY_NOT_FOUND);

    snapshot s2 = m_db.begin_snapshot();
    REQUIRE(s2.get("a") == "changed");
    REQUIRE(s2.get("c") == "3");
  }

  void discardTwiceTest() {
    snapshot s = m_db.begin_snapshot();
    s.discard();
    REQUIRE_CATCH(s.discard(), KVH_UNKNOWN_SESSION);
  }

  void moveTest() {
    snapshot s1 = m_db.begin_snapshot();
    std::string id = s1.get_id();
    snapshot s2;
    s2 = std::move(s1);
    REQUIRE(s1.get_handle() == 0);
    REQUIRE(s2.get_id() == id);
    REQUIRE_CATCH(s1.discard(), KVH_INV_PARAMETER);
    s2.discard();
  }
};

TEST_CASE("Snapshot/getTest", "")
{
  SnapshotFixture f;
  f.getTest();
}

TEST_CASE("Snapshot/missingKeyTest", "")
{
  SnapshotFixture f;
  f.missingKeyTest();
}

TEST_CASE("Snapshot/isolationTest", "")
{
  SnapshotFixture f;
  f.isolationTest();
}

TEST_CASE("Snapshot/discardTwiceTest", "")
{
  SnapshotFixture f;
  f.discardTwiceTest();
}

TEST_CASE("Snapshot/moveTest", "")
{
  SnapshotFixture f;
  f.moveTest();
}
