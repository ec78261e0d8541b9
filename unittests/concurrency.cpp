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

#include <errno.h>
#include <poll.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include <boost/chrono.hpp>

#include "1base/mutex.h"
#include "1base/util.h"
#include "1os/curl_client.h"

#include "fake_server.h"
#include "utils.h"

using namespace kvhttp;

// how long a request waits for the other one
#define OVERLAP_TIMEOUT_MS    5000

// Forwards to a FakeServer. While armed, every request blocks till a
// second request is in flight (or the timeout expires).
struct RendezvousServer : public http_client {
  RendezvousServer()
    : armed(false), in_flight(0), max_in_flight(0) {
  }

  virtual kvh_status_t post(context *ctx, const std::string &url,
                  const std::string &content_type, const std::string &body,
                  long *status, std::string *reply_body) {
    {
      ScopedLock lock(mutex);
      in_flight++;
      if (in_flight > max_in_flight)
        max_in_flight = in_flight;
      cond.notify_all();

      boost::chrono::steady_clock::time_point deadline
              = boost::chrono::steady_clock::now()
                  + boost::chrono::milliseconds(OVERLAP_TIMEOUT_MS);
      while (armed && max_in_flight < 2) {
        if (cond.wait_until(lock, deadline) == boost::cv_status::timeout)
          break;
      }
    }

    kvh_status_t st;
    {
      ScopedLock lock(server_mutex);
      st = server.post(ctx, url, content_type, body, status, reply_body);
    }

    ScopedLock lock(mutex);
    in_flight--;
    return st;
  }

  FakeServer server;
  Mutex server_mutex;

  Mutex mutex;
  Condition cond;
  bool armed;
  int in_flight;
  int max_in_flight;
};

// reads a value in a separate thread
struct Reader {
  Reader(txn *t_, snapshot *s_, const std::string &key_)
    : t(t_), s(s_), key(key_), status(-1) {
  }

  void run() {
    try {
      value = t ? t->get(key) : s->get(key);
      status = 0;
    }
    catch (error &ex) {
      status = ex.get_errno();
    }
  }

  txn *t;
  snapshot *s;
  std::string key;
  std::string value;
  kvh_status_t status;
};

// A minimal HTTP server on 127.0.0.1. It accepts two connections before
// it replies to any of them; if the second connection does not arrive in
// time, the first one is answered anyway.
struct PairedHttpServer {
  PairedHttpServer()
    : fd(-1), port(0), accepted_both(false) {
    fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);
    int on = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

    struct sockaddr_in addr;
    ::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    REQUIRE(::bind(fd, (struct sockaddr *)&addr, sizeof(addr)) == 0);
    REQUIRE(::listen(fd, 8) == 0);

    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(fd, (struct sockaddr *)&addr, &len) == 0);
    port = ntohs(addr.sin_port);
  }

  ~PairedHttpServer() {
    if (fd >= 0)
      ::close(fd);
  }

  std::string url(const char *path) const {
    char buffer[64];
    util_snprintf(buffer, sizeof(buffer), "http://127.0.0.1:%d%s", port,
                    path);
    return buffer;
  }

  void run() {
    std::vector<int> connections;
    while (connections.size() < 2) {
      struct pollfd p;
      p.fd = fd;
      p.events = POLLIN;
      p.revents = 0;
      int rc = ::poll(&p, 1, OVERLAP_TIMEOUT_MS);
      if (rc < 0 && errno == EINTR)
        continue;
      if (rc <= 0)
        break;
      int c = ::accept(fd, 0, 0);
      if (c >= 0)
        connections.push_back(c);
    }
    accepted_both = connections.size() == 2;

    for (size_t i = 0; i < connections.size(); i++) {
      read_request(connections[i]);
      const char *reply = "HTTP/1.1 200 OK\r\n"
                          "Content-Type: application/json\r\n"
                          "Content-Length: 2\r\n"
                          "Connection: close\r\n"
                          "\r\n"
                          "{}";
      ::send(connections[i], reply, ::strlen(reply), MSG_NOSIGNAL);
      ::close(connections[i]);
    }
  }

  // reads the header and the body of a request
  void read_request(int c) {
    std::string request;
    char buffer[1024];
    size_t header_end = std::string::npos;
    size_t content_length = 0;

    while (true) {
      if (header_end != std::string::npos
              && request.size() >= header_end + 4 + content_length)
        return;
      ssize_t r = ::recv(c, buffer, sizeof(buffer), 0);
      if (r <= 0)
        return;
      request.append(buffer, r);

      if (header_end == std::string::npos) {
        header_end = request.find("\r\n\r\n");
        if (header_end != std::string::npos) {
          std::string header = util_to_lower(request.substr(0, header_end));
          size_t pos = header.find("content-length:");
          if (pos != std::string::npos)
            content_length = (size_t)::strtoul(header.c_str() + pos + 15,
                                    0, 10);
        }
      }
    }
  }

  int fd;
  int port;
  bool accepted_both;
};

// posts one request through a shared CurlClient
struct Poster {
  Poster(CurlClient *client_, const std::string &url_)
    : client(client_), url(url_), status(-1), http_status(0) {
  }

  void run() {
    status = client->post(0, url, KVH_CONTENT_TYPE, "{}", &http_status,
                    &reply);
  }

  CurlClient *client;
  std::string url;
  kvh_status_t status;
  long http_status;
  std::string reply;
};

struct ConcurrencyFixture {
  RendezvousServer transport;
  db m_db;

  ConcurrencyFixture()
    : m_db(FAKE_SERVER_URL, &transport) {
    transport.server.data["a"] = "1";
    transport.server.data["b"] = "2";
  }

  void parallelHandlesTest() {
    txn t = m_db.begin_transaction();
    snapshot s = m_db.begin_snapshot();
    transport.armed = true;

    Reader r1(&t, 0, "a");
    Reader r2(0, &s, "b");
    Thread th1(&Reader::run, &r1);
    Thread th2(&Reader::run, &r2);
    th1.join();
    th2.join();

    // both requests were in the transport at the same time
    REQUIRE(transport.max_in_flight == 2);
    REQUIRE(r1.status == 0);
    REQUIRE(r1.value == "1");
    REQUIRE(r2.status == 0);
    REQUIRE(r2.value == "2");
  }

  void curlParallelRequestsTest() {
    PairedHttpServer http;
    Thread server_thread(&PairedHttpServer::run, &http);

    CurlClient client(20000, 5000, false);
    Poster p1(&client, http.url("/db/tx/get"));
    Poster p2(&client, http.url("/db/snap/get"));
    Thread th1(&Poster::run, &p1);
    Thread th2(&Poster::run, &p2);
    th1.join();
    th2.join();
    server_thread.join();

    // the server saw both connections before it answered the first one
    REQUIRE(http.accepted_both);
    REQUIRE(p1.status == 0);
    REQUIRE(p1.http_status == 200);
    REQUIRE(p1.reply == "{}");
    REQUIRE(p2.status == 0);
    REQUIRE(p2.http_status == 200);
    REQUIRE(p2.reply == "{}");
  }
};

TEST_CASE("Concurrency/parallelHandlesTest", "")
{
  ConcurrencyFixture f;
  f.parallelHandlesTest();
}

TEST_CASE("Concurrency/curlParallelRequestsTest", "")
{
  ConcurrencyFixture f;
  f.curlParallelRequestsTest();
}
