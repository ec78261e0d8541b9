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

#include <string>

#include <catch2/catch.hpp>

#include "1base/error.h"
#include "1globals/globals.h"

#include "utils.h"

using namespace kvhttp;

static int s_level;
static std::string s_message;

static void KVH_CALLCONV
my_handler(int level, const char *message)
{
  s_level = level;
  s_message = message;
}

struct ErrorFixture {
  kvh_error_handler_fun m_old_handler;

  ErrorFixture()
    : m_old_handler(Globals::ms_error_handler) {
  }

  ~ErrorFixture() {
    kvh_set_error_handler(m_old_handler);
  }

  void errorHandlerTest() {
    kvh_set_error_handler(my_handler);
    REQUIRE(Globals::ms_error_handler == my_handler);

    kvh_log(("hello world %d", 42));
    REQUIRE(s_level == KVH_DEBUG_LEVEL_NORMAL);
    REQUIRE(s_message.find("hello world 42") != std::string::npos);

    // NULL restores the default handler
    kvh_set_error_handler(0);
    REQUIRE(Globals::ms_error_handler == default_errhandler);
  }

  void cppErrorHandlerTest() {
    db::set_errhandler(my_handler);
    REQUIRE(Globals::ms_error_handler == my_handler);
    db::set_errhandler(0);
    REQUIRE(Globals::ms_error_handler == default_errhandler);
  }

  void strerrorTest() {
    REQUIRE(std::string("Success") == kvh_strerror(KVH_SUCCESS));
    REQUIRE(std::string("Invalid parameter")
                    == kvh_strerror(KVH_INV_PARAMETER));
    REQUIRE(std::string("Key not found") == kvh_strerror(KVH_KEY_NOT_FOUND));
    REQUIRE(std::string("Transport error")
                    == kvh_strerror(KVH_TRANSPORT_ERROR));
    REQUIRE(std::string("Operation was cancelled")
                    == kvh_strerror(KVH_CANCELLED));
    REQUIRE(std::string("Unknown cursor")
                    == kvh_strerror(KVH_UNKNOWN_CURSOR));
    REQUIRE(std::string("Unknown error") == kvh_strerror(-12345));
  }

  void isDomainErrorTest() {
    REQUIRE(kvh_is_domain_error(KVH_KEY_NOT_FOUND));
    REQUIRE(kvh_is_domain_error(KVH_INV_PARAMETER));
    REQUIRE(kvh_is_domain_error(KVH_DOMAIN_ERROR));
    REQUIRE(kvh_is_domain_error(KVH_UNKNOWN_SESSION));
    REQUIRE(kvh_is_domain_error(KVH_UNKNOWN_CURSOR));
    REQUIRE(!kvh_is_domain_error(KVH_SUCCESS));
    REQUIRE(!kvh_is_domain_error(KVH_TRANSPORT_ERROR));
    REQUIRE(!kvh_is_domain_error(KVH_CANCELLED));
    REQUIRE(!kvh_is_domain_error(KVH_PROTOCOL_ERROR));
  }

  void errorClassTest() {
    error e(KVH_TRANSPORT_ERROR, "received non-ok http status 500", 500);
    REQUIRE(e.get_errno() == KVH_TRANSPORT_ERROR);
    REQUIRE(std::string(e.get_string()) == "Transport error");
    REQUIRE(e.get_message() == "received non-ok http status 500");
    REQUIRE(e.get_http_status() == 500);

    error none;
    REQUIRE(none.get_errno() == 0);
    REQUIRE(none.get_http_status() == 0);
  }
};

TEST_CASE("Error/errorHandlerTest", "")
{
  ErrorFixture f;
  f.errorHandlerTest();
}

TEST_CASE("Error/cppErrorHandlerTest", "")
{
  ErrorFixture f;
  f.cppErrorHandlerTest();
}

TEST_CASE("Error/strerrorTest", "")
{
  ErrorFixture f;
  f.strerrorTest();
}

TEST_CASE("Error/isDomainErrorTest", "")
{
  ErrorFixture f;
  f.isDomainErrorTest();
}

TEST_CASE("Error/errorClassTest", "")
{
  ErrorFixture f;
  f.errorClassTest();
}
