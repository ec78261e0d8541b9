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

#include <fstream>
#include <sstream>

#include <catch2/catch.hpp>

#include "4txn/txn_remote.h"

#include "fake_server.h"
#include "utils.h"

using namespace kvhttp;

struct TxnFixture {
  FakeServer server;
  db m_db;

  TxnFixture()
    : m_db(FAKE_SERVER_URL, &server) {
  }

  void setGetTest() {
    txn t = m_db.begin_transaction();
    t.set("a", "1");
    t.set("b", std::string("\0\1\2", 3));
    REQUIRE(t.get("a") == "1");
    REQUIRE(t.get("b") == std::string("\0\1\2", 3));
    REQUIRE(server.paths[1] == "/tx/set");
    REQUIRE(server.paths[3] == "/tx/get");
  }

  void overwriteTest() {
    txn t = m_db.begin_transaction();
    t.set("a", "1");
    t.set("a", "2");
    REQUIRE(t.get("a") == "2");
  }

  void emptyValueTest() {
    txn t = m_db.begin_transaction();
    t.set("a", "");
    REQUIRE(t.get("a") == "");
  }

  void commitTest() {
    txn t1 = m_db.begin_transaction();
    t1.set("a", "1");
    t1.set("b", "2");
    t1.commit();

    txn t2 = m_db.begin_transaction();
    REQUIRE(t2.get("a") == "1");
    REQUIRE(t2.get("b") == "2");

    snapshot s = m_db.begin_snapshot();
    REQUIRE(s.get("a") == "1");
  }

  void rollbackTest() {
    txn t1 = m_db.begin_transaction();
    t1.set("a", "1");
    t1.rollback();

    txn t2 = m_db.begin_transaction();
    REQUIRE_CATCH(t2.get("a"), KVH_KEY_NOT_FOUND);
  }

  void keyNotFoundTest() {
    txn t = m_db.begin_transaction();
    try {
      t.get("missing");
      REQUIRE(false);
    }
    catch (error &e) {
      REQUIRE(e.get_errno() == KVH_KEY_NOT_FOUND);
      // the server's message is kept verbatim
      REQUIRE(e.get_message() == "file does not exist");
      REQUIRE(kvh_is_domain_error(e.get_errno()));
    }
  }

  void eraseTest() {
    txn t = m_db.begin_transaction();
    t.set("a", "1");
    t.erase("a");
    REQUIRE_CATCH(t.get("a"), KVH_KEY_NOT_FOUND);

    // deleting a missing key is not an error for this server
    t.erase("a");
    REQUIRE(server.request_count("/tx/delete") == 2u);
  }

  void invalidKeyTest() {
    txn t = m_db.begin_transaction();
    REQUIRE_CATCH(t.set("", "1"), KVH_INV_PARAMETER);
  }

  void closedTxnTest() {
    txn t = m_db.begin_transaction();
    t.commit();

    REQUIRE_CATCH(t.get("a"), KVH_UNKNOWN_SESSION);
    REQUIRE_CATCH(t.set("a", "1"), KVH_UNKNOWN_SESSION);
    REQUIRE_CATCH(t.erase("a"), KVH_UNKNOWN_SESSION);
    REQUIRE_CATCH(t.commit(), KVH_UNKNOWN_SESSION);
    REQUIRE_CATCH(t.rollback(), KVH_UNKNOWN_SESSION);
  }

  void streamValueTest() {
    txn t = m_db.begin_transaction();
    std::istringstream is("a long value\nwith two lines");
    t.set("a", &is);
    REQUIRE(t.get("a") == "a long value\nwith two lines");

    std::istringstream empty("");
    t.set("b", &empty);
    REQUIRE(t.get("b") == "");
  }

  void nullValueTest() {
    txn t = m_db.begin_transaction();
    size_t count = server.request_count();
    REQUIRE_CATCH(t.set("a", (std::istream *)0), KVH_INV_PARAMETER);
    REQUIRE(server.request_count() == count);

    RemoteTxn *rt = t.get_handle();
    REQUIRE_EXCEPTION(rt->set(0, "a", 0), KVH_INV_PARAMETER);
    REQUIRE(server.request_count() == count);
  }

  void brokenStreamTest() {
    txn t = m_db.begin_transaction();
    size_t count = server.request_count();
    std::ifstream is("/this/file/does/not/exist");
    REQUIRE_CATCH(t.set("a", &is), KVH_IO_ERROR);
    REQUIRE(server.request_count() == count);
  }

  void cancelledTest() {
    txn t = m_db.begin_transaction();
    context ctx;
    ctx.cancel();
    size_t count = server.request_count();
    REQUIRE_CATCH(t.set("a", "1", &ctx), KVH_CANCELLED);
    REQUIRE_CATCH(t.get("a", &ctx), KVH_CANCELLED);
    REQUIRE_CATCH(t.commit(&ctx), KVH_CANCELLED);
    REQUIRE(server.request_count() == count);

    // the transaction is still alive
    t.set("a", "1");
    t.commit();
  }

  void moveTest() {
    txn t1 = m_db.begin_transaction();
    std::string id = t1.get_id();
    txn t2(std::move(t1));
    REQUIRE(t1.get_handle() == 0);
    REQUIRE(t1.get_id() == "");
    REQUIRE(t2.get_id() == id);
    REQUIRE_CATCH(t1.get("a"), KVH_INV_PARAMETER);

    txn t3;
    t3 = std::move(t2);
    REQUIRE(t3.get_id() == id);
    t3.set("a", "1");
    t3.commit();
  }
};

TEST_CASE("Txn/setGetTest", "")
{
  TxnFixture f;
  f.setGetTest();
}

TEST_CASE("Txn/overwriteTest", "")
{
  TxnFixture f;
  f.overwriteTest();
}

TEST_CASE("Txn/emptyValueTest", "")
{
  TxnFixture f;
  f.emptyValueTest();
}

TEST_CASE("Txn/commitTest", "")
{
  TxnFixture f;
  f.commitTest();
}

TEST_CASE("Txn/rollbackTest", "")
{
  TxnFixture f;
  f.rollbackTest();
}

TEST_CASE("Txn/keyNotFoundTest", "")
{
  TxnFixture f;
  f.keyNotFoundTest();
}

TEST_CASE("Txn/eraseTest", "")
{
  TxnFixture f;
  f.eraseTest();
}

TEST_CASE("Txn/invalidKeyTest", "")
{
  TxnFixture f;
  f.invalidKeyTest();
}

TEST_CASE("Txn/closedTxnTest", "")
{
  TxnFixture f;
  f.closedTxnTest();
}

TEST_CASE("Txn/streamValueTest", "")
{
  TxnFixture f;
  f.streamValueTest();
}

TEST_CASE("Txn/nullValueTest", "")
{
  TxnFixture f;
  f.nullValueTest();
}

TEST_CASE("Txn/brokenStreamTest", "")
{
  TxnFixture f;
  f.brokenStreamTest();
}

TEST_CASE("Txn/cancelledTest", "")
{
  TxnFixture f;
  f.cancelledTest();
}

TEST_CASE("Txn/moveTest", "")
{
  TxnFixture f;
  f.moveTest();
}
