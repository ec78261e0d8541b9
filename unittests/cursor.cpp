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

#include <vector>

#include <catch2/catch.hpp>

#include "1base/util.h"
#include "4cursor/cursor_remote.h"
#include "4txn/snapshot_remote.h"

#include "fake_server.h"
#include "utils.h"

using namespace kvhttp;

struct CursorFixture {
  FakeServer server;
  db m_db;

  CursorFixture()
    : m_db(FAKE_SERVER_URL, &server) {
    server.data["a"] = "1";
    server.data["b"] = "2";
    server.data["c"] = "3";
    server.data["d"] = "4";
    server.data["e"] = "5";
  }

  // reads all keys of a cursor
  std::string keys(cursor &c) {
    std::string result, key, value;
    while (c.next(&key, &value))
      result += key;
    REQUIRE(!c.is_failed());
    return result;
  }

  void ascendTest() {
    snapshot s = m_db.begin_snapshot();
    cursor c = s.ascend("", "");
    REQUIRE(keys(c) == "abcde");

    cursor c2 = s.ascend("b", "d");
    REQUIRE(keys(c2) == "bc");

    cursor c3 = s.ascend("c", "");
    REQUIRE(keys(c3) == "cde");

    cursor c4 = s.ascend("", "c");
    REQUIRE(keys(c4) == "ab");

    cursor c5 = s.ascend("x", "");
    REQUIRE(keys(c5) == "");
  }

  void descendTest() {
    snapshot s = m_db.begin_snapshot();
    cursor c = s.descend("", "");
    REQUIRE(keys(c) == "edcba");

    cursor c2 = s.descend("b", "d");
    REQUIRE(keys(c2) == "cb");
  }

  void scanTest() {
    txn t = m_db.begin_transaction();
    t.set("f", "6");
    cursor c = t.scan();
    REQUIRE(keys(c) == "abcdef");
    REQUIRE(server.request_count("/tx/scan") == 1u);
  }

  void valuesTest() {
    txn t = m_db.begin_transaction();
    cursor c = t.ascend("b", "c");
    std::string key, value;
    REQUIRE(c.next(&key, &value));
    REQUIRE(key == "b");
    REQUIRE(value == "2");
    REQUIRE(!c.next(&key, &value));

    // key and value can be NULL
    cursor c2 = t.ascend("", "");
    REQUIRE(c2.next(0, 0));
  }

  void txnSeesOwnWritesTest() {
    txn t = m_db.begin_transaction();
    t.erase("a");
    t.set("bb", "x");
    cursor c = t.ascend("", "c");
    REQUIRE(keys(c) == "bbb");
  }

  void lazyOpenTest() {
    snapshot s = m_db.begin_snapshot();
    size_t count = server.request_count();

    // creating a cursor does not contact the server
    cursor c = s.ascend("", "");
    REQUIRE(server.request_count() == count);

    std::string key, value;
    REQUIRE(c.next(&key, &value));
    REQUIRE(server.request_count("/snap/ascend") == 1u);
    REQUIRE(server.request_count("/it/next") == 1u);

    // the open request carries the cursor id and the bounds
    std::string open = server.bodies[count];
    REQUIRE(util_contains(open, ("\"Name\":\"" + c.get_id() + "\"").c_str()));
    REQUIRE(util_contains(open, ("\"Snapshot\":\"" + s.get_id() + "\"").c_str()));
    REQUIRE(util_contains(server.bodies[count + 1],
                    ("\"Iterator\":\"" + c.get_id() + "\"").c_str()));
  }

  void exhaustedTest() {
    snapshot s = m_db.begin_snapshot();
    cursor c = s.ascend("d", "");
    REQUIRE(keys(c) == "de");

    // 1 open, 2 entries, 1 end-of-data
    REQUIRE(server.request_count("/it/next") == 3u);

    // no more requests after the end
    std::string key, value;
    size_t count = server.request_count();
    REQUIRE(!c.next(&key, &value));
    REQUIRE(!c.next(&key, &value));
    REQUIRE(server.request_count() == count);
    REQUIRE(c.get_handle()->state == RemoteCursor::kExhausted);
  }

  void earlyStopTest() {
    txn t = m_db.begin_transaction();
    size_t count;
    {
      cursor c = t.ascend("", "");
      std::string key, value;
      REQUIRE(c.next(&key, &value));
      REQUIRE(key == "a");
      count = server.request_count();
    }

    // dropping the cursor sends nothing
    REQUIRE(server.request_count() == count);

    // the session is not affected
    t.set("z", "26");
    REQUIRE(t.get("z") == "26");
    t.commit();
  }

  void neverOpenedTest() {
    snapshot s = m_db.begin_snapshot();
    size_t count = server.request_count();
    {
      cursor c = s.descend("", "");
    }
    REQUIRE(server.request_count() == count);
  }

  void freshIdsTest() {
    snapshot s = m_db.begin_snapshot();
    cursor c1 = s.ascend("", "");
    cursor c2 = s.ascend("", "");
    REQUIRE(c1.get_id().size() == 36u);
    REQUIRE(c1.get_id() != c2.get_id());
    REQUIRE(c1.get_id() != s.get_id());

    // two cursors over the same range are independent
    std::string key, value;
    REQUIRE(c1.next(&key, &value));
    REQUIRE(c1.next(&key, &value));
    REQUIRE(key == "b");
    REQUIRE(c2.next(&key, &value));
    REQUIRE(key == "a");
  }

  void restartTest() {
    snapshot s = m_db.begin_snapshot();
    cursor c = s.ascend("", "");
    std::string key, value;
    REQUIRE(c.next(&key, &value));
    REQUIRE(c.next(&key, &value));

    // a new cursor restarts the sequence
    c = s.ascend("", "");
    REQUIRE(keys(c) == "abcde");
  }

  void openFailsTest() {
    txn t = m_db.begin_transaction();
    t.rollback();

    cursor c = t.ascend("", "");
    std::string key, value;
    REQUIRE(!c.next(&key, &value));
    REQUIRE(c.is_failed());
    REQUIRE(c.get_error().get_errno() == KVH_UNKNOWN_SESSION);
    REQUIRE(c.get_error().get_message() == "transaction does not exist");
    REQUIRE(server.request_count("/it/next") == 0u);
    REQUIRE(c.get_handle()->state == RemoteCursor::kFailed);

    // no more requests after a failure
    size_t count = server.request_count();
    REQUIRE(!c.next(&key, &value));
    REQUIRE(server.request_count() == count);

    REQUIRE_CATCH(c.check(), KVH_UNKNOWN_SESSION);
  }

  void unknownCursorTest() {
    snapshot s = m_db.begin_snapshot();
    cursor c = s.ascend("", "");
    std::string key, value;
    REQUIRE(c.next(&key, &value));

    // the server lost the iterator
    server.drop_iterators();
    REQUIRE(!c.next(&key, &value));
    REQUIRE(c.is_failed());
    REQUIRE(c.get_error().get_errno() == KVH_UNKNOWN_CURSOR);
    REQUIRE(key == "a");
  }

  void neverOpenedIdTest() {
    snapshot s = m_db.begin_snapshot();
    RemoteCursor *rc = s.get_handle()->ascend("", "");
    cursor c(rc);

    // skip the open request
    rc->state = RemoteCursor::kOpen;
    std::string key, value;
    REQUIRE(!c.next(&key, &value));
    REQUIRE(c.get_error().get_errno() == KVH_UNKNOWN_CURSOR);
  }

  void transportFailureTest() {
    snapshot s = m_db.begin_snapshot();
    cursor c = s.ascend("", "");
    std::string key, value;
    REQUIRE(c.next(&key, &value));

    server.http_status = 502;
    REQUIRE(!c.next(&key, &value));
    REQUIRE(c.get_error().get_errno() == KVH_TRANSPORT_ERROR);
    REQUIRE(c.get_error().get_http_status() == 502);

    // the cursor does not recover
    server.http_status = 0;
    REQUIRE(!c.next(&key, &value));
  }

  void cancelledTest() {
    snapshot s = m_db.begin_snapshot();
    cursor c = s.ascend("", "");
    context ctx;
    ctx.cancel();
    std::string key, value;
    REQUIRE(!c.next(&key, &value, &ctx));
    REQUIRE(c.get_error().get_errno() == KVH_CANCELLED);
  }

  void sessionClosedTest() {
    txn t = m_db.begin_transaction();
    cursor c = t.ascend("", "");
    std::string key, value;
    REQUIRE(c.next(&key, &value));
    t.commit();

    // the server dropped the iterators of the transaction
    REQUIRE(!c.next(&key, &value));
    REQUIRE(c.get_error().get_errno() == KVH_UNKNOWN_CURSOR);
  }

  void txnDestroyedTest() {
    cursor c;
    {
      txn t = m_db.begin_transaction();
      t.set("f", "6");
      c = t.scan();
    }

    // the transaction is still open on the server
    REQUIRE(keys(c) == "abcdef");
    REQUIRE(server.request_count("/tx/scan") == 1u);
  }

  void snapshotReassignedTest() {
    snapshot s = m_db.begin_snapshot();
    std::string first = s.get_id();
    cursor c = s.descend("b", "e");
    s = m_db.begin_snapshot();
    REQUIRE(s.get_id() != first);

    std::string key, value;
    REQUIRE(c.next(&key, &value));
    REQUIRE(key == "d");
    REQUIRE(util_contains(server.bodies[server.bodies.size() - 2],
                    ("\"Snapshot\":\"" + first + "\"").c_str()));
    REQUIRE(keys(c) == "cb");
  }

  void defaultCursorTest() {
    cursor c;
    std::string key, value;
    REQUIRE(!c.next(&key, &value));
    REQUIRE(c.get_error().get_errno() == KVH_INV_PARAMETER);
    REQUIRE(c.get_id() == "");
  }
};

TEST_CASE("Cursor/ascendTest", "")
{
  CursorFixture f;
  f.ascendTest();
}

TEST_CASE("Cursor/descendTest", "")
{
  CursorFixture f;
  f.descendTest();
}

TEST_CASE("Cursor/scanTest", "")
{
  CursorFixture f;
  f.scanTest();
}

TEST_CASE("Cursor/valuesTest", "")
{
  CursorFixture f;
  f.valuesTest();
}

TEST_CASE("Cursor/txnSeesOwnWritesTest", "")
{
  CursorFixture f;
  f.txnSeesOwnWritesTest();
}

TEST_CASE("Cursor/lazyOpenTest", "")
{
  CursorFixture f;
  f.lazyOpenTest();
}

TEST_CASE("Cursor/exhaustedTest", "")
{
  CursorFixture f;
  f.exhaustedTest();
}

TEST_CASE("Cursor/earlyStopTest", "")
{
  CursorFixture f;
  f.earlyStopTest();
}

TEST_CASE("Cursor/neverOpenedTest", "")
{
  CursorFixture f;
  f.neverOpenedTest();
}

TEST_CASE("Cursor/freshIdsTest", "")
{
  CursorFixture f;
  f.freshIdsTest();
}

TEST_CASE("Cursor/restartTest", "")
{
  CursorFixture f;
  f.restartTest();
}

TEST_CASE("Cursor/openFailsTest", "")
{
  CursorFixture f;
  f.openFailsTest();
}

TEST_CASE("Cursor/unknownCursorTest", "")
{
  CursorFixture f;
  f.unknownCursorTest();
}

TEST_CASE("Cursor/neverOpenedIdTest", "")
{
  CursorFixture f;
  f.neverOpenedIdTest();
}

TEST_CASE("Cursor/transportFailureTest", "")
{
  CursorFixture f;
  f.transportFailureTest();
}

TEST_CASE("Cursor/cancelledTest", "")
{
  CursorFixture f;
  f.cancelledTest();
}

TEST_CASE("Cursor/sessionClosedTest", "")
{
  CursorFixture f;
  f.sessionClosedTest();
}

TEST_CASE("Cursor/defaultCursorTest", "")
{
  CursorFixture f;
  f.defaultCursorTest();
}

TEST_CASE("Cursor/txnDestroyedTest", "")
{
  CursorFixture f;
  f.txnDestroyedTest();
}

TEST_CASE("Cursor/snapshotReassignedTest", "")
{
  CursorFixture f;
  f.snapshotReassignedTest();
}
