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

#include "1base/util.h"
#include "4db/db_remote.h"

#include "fake_server.h"
#include "utils.h"

using namespace kvhttp;

struct DbFixture {
  FakeServer server;
  db m_db;

  DbFixture()
    : m_db(FAKE_SERVER_URL, &server) {
  }

  void openTest() {
    // opening a database does not contact the server
    REQUIRE(server.request_count() == 0u);
    REQUIRE(m_db.get_server_url() == FAKE_SERVER_URL);
    REQUIRE(m_db.get_handle() != 0);
  }

  void invalidUrlTest() {
    db d;
    REQUIRE_CATCH(d.open("gopher://localhost/db", &server),
                    KVH_INV_PARAMETER);
    REQUIRE(d.get_handle() == 0);
    REQUIRE_CATCH(d.begin_transaction(), KVH_INV_PARAMETER);
  }

  void invalidParameterTest() {
    kvh_parameter_t params[] = {
      { 0xdead, 1 },
      { 0, 0 }
    };
    db d;
    REQUIRE_CATCH(d.open(FAKE_SERVER_URL, &server, &params[0]),
                    KVH_INV_PARAMETER);
  }

  void getParametersTest() {
    kvh_parameter_t in[] = {
      { KVH_PARAM_TIMEOUT_MS, 1234 },
      { 0, 0 }
    };
    db d(FAKE_SERVER_URL, &server, &in[0]);

    kvh_parameter_t out[] = {
      { KVH_PARAM_TIMEOUT_MS, 0 },
      { KVH_PARAM_CONNECT_TIMEOUT_MS, 0 },
      { 0, 0 }
    };
    d.get_parameters(&out[0]);
    REQUIRE(out[0].value == 1234u);
    REQUIRE(out[1].value == 10000u);
  }

  void beginTransactionTest() {
    txn t = m_db.begin_transaction();
    REQUIRE(t.get_id().size() == 36u);
    REQUIRE(server.paths[0] == "/new-transaction");
    REQUIRE(util_contains(server.bodies[0],
                    ("\"Name\":\"" + t.get_id() + "\"").c_str()));
    REQUIRE(server.txns.count(t.get_id()) == 1u);
  }

  void beginSnapshotTest() {
    snapshot s = m_db.begin_snapshot();
    REQUIRE(s.get_id().size() == 36u);
    REQUIRE(server.paths[0] == "/new-snapshot");
    REQUIRE(server.snapshots.count(s.get_id()) == 1u);
  }

  void freshIdsTest() {
    txn t1 = m_db.begin_transaction();
    txn t2 = m_db.begin_transaction();
    snapshot s1 = m_db.begin_snapshot();
    REQUIRE(t1.get_id() != t2.get_id());
    REQUIRE(t1.get_id() != s1.get_id());
    REQUIRE(server.txns.size() == 2u);
  }

  void beginRejectedTest() {
    server.reply = "{\"Error\":\"too many transactions\"}";
    try {
      m_db.begin_transaction();
      REQUIRE(false);
    }
    catch (error &e) {
      REQUIRE(e.get_errno() == KVH_DOMAIN_ERROR);
      REQUIRE(e.get_message() == "too many transactions");
    }
  }

  void beginTransportErrorTest() {
    server.http_status = 503;
    try {
      m_db.begin_snapshot();
      REQUIRE(false);
    }
    catch (error &e) {
      REQUIRE(e.get_errno() == KVH_TRANSPORT_ERROR);
      REQUIRE(e.get_http_status() == 503);
    }
  }

  void closeTest() {
    txn t = m_db.begin_transaction();
    size_t count = server.request_count();

    // closing does not contact the server; it can be called twice
    m_db.close();
    m_db.close();
    REQUIRE(server.request_count() == count);
    REQUIRE(server.txns.size() == 1u);

    REQUIRE_CATCH(m_db.begin_transaction(), KVH_INV_PARAMETER);
    REQUIRE_CATCH(m_db.get_server_url(), KVH_INV_PARAMETER);
  }

  void reopenTest() {
    m_db.close();
    m_db.open(FAKE_SERVER_URL "/", &server);
    REQUIRE(m_db.get_server_url() == FAKE_SERVER_URL);
    txn t = m_db.begin_transaction();
    REQUIRE(server.urls[0] == FAKE_SERVER_URL "/new-transaction");
  }

  void sharedClientTest() {
    db other(FAKE_SERVER_URL, &server);
    txn t1 = m_db.begin_transaction();
    txn t2 = other.begin_transaction();
    REQUIRE(server.txns.size() == 2u);
  }

  void defaultClientTest() {
    // the database creates its own libcurl client
    db d("http://localhost:8080/db");
    REQUIRE(d.get_server_url() == "http://localhost:8080/db");
    REQUIRE(d.get_handle()->owned_client.get() != 0);
    REQUIRE(m_db.get_handle()->owned_client.get() == 0);
  }

  void connectionRefusedTest() {
    kvh_parameter_t params[] = {
      { KVH_PARAM_CONNECT_TIMEOUT_MS, 2000 },
      { KVH_PARAM_TIMEOUT_MS, 5000 },
      { 0, 0 }
    };
    // nobody listens on port 1
    db d("http://127.0.0.1:1/db", 0, &params[0]);
    try {
      d.begin_transaction();
      REQUIRE(false);
    }
    catch (error &e) {
      REQUIRE(e.get_errno() == KVH_TRANSPORT_ERROR);
      REQUIRE(e.get_http_status() == 0);
    }
  }

  void versionTest() {
    uint32_t major, minor, revision;
    db::get_version(&major, &minor, &revision);
    REQUIRE(major == 1u);
    REQUIRE(minor == 0u);
    REQUIRE(revision == 0u);
    db::get_version(0, 0, 0);
  }
};

TEST_CASE("Db/openTest", "")
{
  DbFixture f;
  f.openTest();
}

TEST_CASE("Db/invalidUrlTest", "")
{
  DbFixture f;
  f.invalidUrlTest();
}

TEST_CASE("Db/invalidParameterTest", "")
{
  DbFixture f;
  f.invalidParameterTest();
}

TEST_CASE("Db/getParametersTest", "")
{
  DbFixture f;
  f.getParametersTest();
}

TEST_CASE("Db/beginTransactionTest", "")
{
  DbFixture f;
  f.beginTransactionTest();
}

TEST_CASE("Db/beginSnapshotTest", "")
{
  DbFixture f;
  f.beginSnapshotTest();
}

TEST_CASE("Db/freshIdsTest", "")
{
  DbFixture f;
  f.freshIdsTest();
}

TEST_CASE("Db/beginRejectedTest", "")
{
  DbFixture f;
  f.beginRejectedTest();
}

TEST_CASE("Db/beginTransportErrorTest", "")
{
  DbFixture f;
  f.beginTransportErrorTest();
}

TEST_CASE("Db/closeTest", "")
{
  DbFixture f;
  f.closeTest();
}

TEST_CASE("Db/reopenTest", "")
{
  DbFixture f;
  f.reopenTest();
}

TEST_CASE("Db/sharedClientTest", "")
{
  DbFixture f;
  f.sharedClientTest();
}

TEST_CASE("Db/defaultClientTest", "")
{
  DbFixture f;
  f.defaultClientTest();
}

TEST_CASE("Db/connectionRefusedTest", "")
{
  DbFixture f;
  f.connectionRefusedTest();
}

TEST_CASE("Db/versionTest", "")
{
  DbFixture f;
  f.versionTest();
}
