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
#include "3invoker/invoker.h"

#include "fake_server.h"
#include "utils.h"

using namespace kvhttp;

struct InvokerFixture {
  DbConfig config;
  FakeServer server;
  Invoker invoker;

  InvokerFixture()
    : invoker(&config, &server) {
    config.set_url(FAKE_SERVER_URL "/");
    server.data["a"] = "1";
    server.txns["t1"] = server.data;
  }

  void get(proto::GetResponse *reply, context *ctx = 0) {
    proto::GetRequest request;
    request.set_transaction("t1");
    request.set_key("a");
    invoker.call(ctx, "/tx/get", request, reply);
  }

  void requestTest() {
    proto::GetResponse reply;
    get(&reply);
    REQUIRE(reply.value() == "1");

    REQUIRE(server.request_count() == 1u);
    REQUIRE(server.urls[0] == "http://localhost:8080/db/tx/get");
    REQUIRE(server.content_types[0] == "application/json");
  }

  void wireFormatTest() {
    proto::SetRequest request;
    request.set_transaction("t1");
    request.set_key("a");
    request.set_value("1");
    proto::SetResponse reply;
    invoker.call(0, "/tx/set", request, &reply);

    // field names are capitalized, byte strings are base64 encoded
    const std::string &body = server.bodies[0];
    REQUIRE(util_contains(body, "\"Transaction\":\"t1\""));
    REQUIRE(util_contains(body, "\"Key\":\"YQ==\""));
    REQUIRE(util_contains(body, "\"Value\":\"MQ==\""));
  }

  void unknownFieldsTest() {
    server.reply = "{\"Error\":\"\",\"Value\":\"MQ==\",\"Extra\":[1,2]}";
    proto::GetResponse reply;
    get(&reply);
    REQUIRE(reply.value() == "1");
  }

  void missingFieldsTest() {
    server.reply = "{}";
    proto::GetResponse reply;
    get(&reply);
    REQUIRE(reply.value() == "");
  }

  void httpStatusTest() {
    server.http_status = 500;
    server.reply = "{\"Error\":\"\"}";
    proto::GetResponse reply;
    try {
      get(&reply);
      REQUIRE(false);
    }
    catch (Exception &ex) {
      REQUIRE(ex.code == KVH_TRANSPORT_ERROR);
      REQUIRE(ex.http_status == 500);
    }
  }

  void successStatusTest() {
    server.http_status = 201;
    server.reply = "{\"Value\":\"MQ==\"}";
    proto::GetResponse reply;
    get(&reply);
    REQUIRE(reply.value() == "1");
  }

  void notFoundPathTest() {
    proto::GetRequest request;
    proto::GetResponse reply;
    try {
      invoker.call(0, "/no/such/path", request, &reply);
      REQUIRE(false);
    }
    catch (Exception &ex) {
      REQUIRE(ex.code == KVH_TRANSPORT_ERROR);
      REQUIRE(ex.http_status == 404);
    }
  }

  void garbageReplyTest() {
    server.reply = "this is not json";
    proto::GetResponse reply;
    REQUIRE_EXCEPTION(get(&reply), KVH_PROTOCOL_ERROR);
  }

  void transportErrorTest() {
    server.transport_status = KVH_TRANSPORT_ERROR;
    proto::GetResponse reply;
    try {
      get(&reply);
      REQUIRE(false);
    }
    catch (Exception &ex) {
      REQUIRE(ex.code == KVH_TRANSPORT_ERROR);
      REQUIRE(ex.http_status == 0);
    }
  }

  void domainErrorTest() {
    server.reply = "{\"Error\":\"disk is on fire\"}";
    proto::GetResponse reply;
    try {
      get(&reply);
      REQUIRE(false);
    }
    catch (Exception &ex) {
      REQUIRE(ex.code == KVH_DOMAIN_ERROR);
      REQUIRE(ex.message == "disk is on fire");
    }

    // perform_request does not look at the error field
    proto::GetRequest request;
    invoker.perform_request(0, "/tx/get", request, &reply);
    REQUIRE(reply.error() == "disk is on fire");
  }

  void cancelledTest() {
    context ctx;
    ctx.cancel();
    proto::GetResponse reply;
    REQUIRE_EXCEPTION(get(&reply, &ctx), KVH_CANCELLED);
    REQUIRE(server.request_count() == 0u);
  }

  void cancelledDuringRequestTest() {
    context ctx;
    server.cancel_during_request = &ctx;
    proto::GetResponse reply;
    REQUIRE_EXCEPTION(get(&reply, &ctx), KVH_CANCELLED);
    REQUIRE(ctx.is_cancelled());
    REQUIRE(server.request_count() == 1u);
  }

  void classifyTest() {
    REQUIRE(Invoker::classify("invalid argument") == KVH_INV_PARAMETER);
    REQUIRE(Invoker::classify("Invalid Argument: empty key")
                == KVH_INV_PARAMETER);
    REQUIRE(Invoker::classify("file does not exist") == KVH_KEY_NOT_FOUND);
    REQUIRE(Invoker::classify("key not found") == KVH_KEY_NOT_FOUND);
    REQUIRE(Invoker::classify("transaction does not exist")
                == KVH_UNKNOWN_SESSION);
    REQUIRE(Invoker::classify("unknown snapshot") == KVH_UNKNOWN_SESSION);
    REQUIRE(Invoker::classify("iterator does not exist")
                == KVH_UNKNOWN_CURSOR);
    REQUIRE(Invoker::classify("Cursor not found") == KVH_UNKNOWN_CURSOR);
    REQUIRE(Invoker::classify("conflict") == KVH_DOMAIN_ERROR);
  }
};

TEST_CASE("Invoker/requestTest", "")
{
  InvokerFixture f;
  f.requestTest();
}

TEST_CASE("Invoker/wireFormatTest", "")
{
  InvokerFixture f;
  f.wireFormatTest();
}

TEST_CASE("Invoker/unknownFieldsTest", "")
{
  InvokerFixture f;
  f.unknownFieldsTest();
}

TEST_CASE("Invoker/missingFieldsTest", "")
{
  InvokerFixture f;
  f.missingFieldsTest();
}

TEST_CASE("Invoker/httpStatusTest", "")
{
  InvokerFixture f;
  f.httpStatusTest();
}

TEST_CASE("Invoker/successStatusTest", "")
{
  InvokerFixture f;
  f.successStatusTest();
}

TEST_CASE("Invoker/notFoundPathTest", "")
{
  InvokerFixture f;
  f.notFoundPathTest();
}

TEST_CASE("Invoker/garbageReplyTest", "")
{
  InvokerFixture f;
  f.garbageReplyTest();
}

TEST_CASE("Invoker/transportErrorTest", "")
{
  InvokerFixture f;
  f.transportErrorTest();
}

TEST_CASE("Invoker/domainErrorTest", "")
{
  InvokerFixture f;
  f.domainErrorTest();
}

TEST_CASE("Invoker/cancelledTest", "")
{
  InvokerFixture f;
  f.cancelledTest();
}

TEST_CASE("Invoker/cancelledDuringRequestTest", "")
{
  InvokerFixture f;
  f.cancelledDuringRequestTest();
}

TEST_CASE("Invoker/classifyTest", "")
{
  InvokerFixture f;
  f.classifyTest();
}
