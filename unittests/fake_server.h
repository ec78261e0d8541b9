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

/*
 * An in-process key/value server which implements kvhttp::http_client.
 * It decodes the requests, keeps transactions, snapshots and iterators in
 * memory and replies like the real server. Requests are recorded, and
 * failures can be injected.
 */

#ifndef KVH_UNITTESTS_FAKE_SERVER_H
#define KVH_UNITTESTS_FAKE_SERVER_H

#include "0root/root.h"

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "kvhttp/kvhttp.hpp"

#define FAKE_SERVER_URL "http://localhost:8080/db"

struct FakeServer : public kvhttp::http_client {
  typedef std::map<std::string, std::string> Map;

  struct Iterator {
    // the transaction or snapshot which opened the iterator
    std::string session;

    std::vector<std::pair<std::string, std::string> > entries;

    size_t position;
  };

  FakeServer()
    : base(FAKE_SERVER_URL), transport_status(0), http_status(0),
      cancel_during_request(0) {
  }

  virtual kvh_status_t post(kvhttp::context *ctx, const std::string &url,
                  const std::string &content_type, const std::string &body,
                  long *status, std::string *reply_body);

  // returns the number of requests
  size_t request_count() const {
    return urls.size();
  }

  // returns the number of requests to |path| (i.e. "/it/next")
  size_t request_count(const std::string &path) const;

  // "forgets" all iterators
  void drop_iterators() {
    iterators.clear();
  }

  // the base url; requests to other urls fail with HTTP 404
  std::string base;

  // the committed data
  Map data;

  // the open transactions, with their private copy of the data
  std::map<std::string, Map> txns;

  // the open snapshots
  std::map<std::string, Map> snapshots;

  // the open iterators
  std::map<std::string, Iterator> iterators;

  // the recorded requests
  std::vector<std::string> urls;
  std::vector<std::string> paths;
  std::vector<std::string> bodies;
  std::vector<std::string> content_types;

  // if not 0: post() fails with this status
  kvh_status_t transport_status;

  // if not 0: post() replies with this HTTP status and |reply|
  long http_status;

  // if not empty: post() replies with this body
  std::string reply;

  // if not NULL: post() cancels this context and fails with KVH_CANCELLED
  kvhttp::context *cancel_during_request;

 private:
  // handles a request; returns false if the request cannot be decoded
  bool dispatch(const std::string &path, const std::string &body,
                  long *status, std::string *reply_body);

  // returns the data of a session, or NULL if the session does not exist
  Map *find_session(bool transaction, const std::string &id);

  // creates an iterator over [begin, end)
  std::string open_iterator(const Map &view, const std::string &session,
                  const std::string &name, const std::string &begin,
                  const std::string &end, bool descending);

  // removes the iterators of a session
  void close_iterators(const std::string &session);
};

#endif // KVH_UNITTESTS_FAKE_SERVER_H
