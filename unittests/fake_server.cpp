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

#include "2protobuf/protocol.h"

#include "fake_server.h"

using namespace kvhttp;

// the error strings of the server
#define ERR_INVALID       "invalid argument"
#define ERR_NOT_EXIST     "file does not exist"
#define ERR_NO_TXN        "transaction does not exist"
#define ERR_NO_SNAP       "snapshot does not exist"
#define ERR_NO_ITERATOR   "iterator does not exist"

template<typename Request>
static bool
decode(const std::string &body, Request *request)
{
  return Protocol::unpack(body, request);
}

template<typename Reply>
static void
encode(const Reply &reply, std::string *reply_body)
{
  Protocol::pack(reply, reply_body);
}

kvh_status_t
FakeServer::post(context *ctx, const std::string &url,
                const std::string &content_type, const std::string &body,
                long *status, std::string *reply_body)
{
  urls.push_back(url);
  bodies.push_back(body);
  content_types.push_back(content_type);

  bool routed = url.compare(0, base.size(), base) == 0;
  paths.push_back(routed ? url.substr(base.size()) : url);

  if (ctx && ctx->is_cancelled())
    return KVH_CANCELLED;
  if (cancel_during_request) {
    cancel_during_request->cancel();
    return KVH_CANCELLED;
  }
  if (transport_status)
    return transport_status;

  if (http_status) {
    *status = http_status;
    *reply_body = reply;
    return 0;
  }
  if (!reply.empty()) {
    *status = 200;
    *reply_body = reply;
    return 0;
  }

  if (!routed) {
    *status = 404;
    *reply_body = "404 page not found\n";
    return 0;
  }

  *status = 200;
  if (!dispatch(paths.back(), body, status, reply_body)) {
    *status = 400;
    *reply_body = "bad request\n";
  }
  return 0;
}

size_t
FakeServer::request_count(const std::string &path) const
{
  size_t count = 0;
  for (size_t i = 0; i < paths.size(); i++)
    if (paths[i] == path)
      count++;
  return count;
}

FakeServer::Map *
FakeServer::find_session(bool transaction, const std::string &id)
{
  std::map<std::string, Map> &sessions = transaction ? txns : snapshots;
  std::map<std::string, Map>::iterator it = sessions.find(id);
  return it == sessions.end() ? 0 : &it->second;
}

std::string
FakeServer::open_iterator(const Map &view, const std::string &session,
                const std::string &name, const std::string &begin,
                const std::string &end, bool descending)
{
  if (name.empty() || iterators.find(name) != iterators.end())
    return ERR_INVALID;

  Iterator it;
  it.session = session;
  it.position = 0;
  for (Map::const_iterator i = view.begin(); i != view.end(); ++i) {
    if (!begin.empty() && i->first < begin)
      continue;
    if (!end.empty() && i->first >= end)
      continue;
    it.entries.push_back(*i);
  }
  if (descending)
    std::reverse(it.entries.begin(), it.entries.end());
  iterators[name] = it;
  return "";
}

void
FakeServer::close_iterators(const std::string &session)
{
  std::map<std::string, Iterator>::iterator it = iterators.begin();
  while (it != iterators.end()) {
    if (it->second.session == session)
      iterators.erase(it++);
    else
      ++it;
  }
}

bool
FakeServer::dispatch(const std::string &path, const std::string &body,
                long *status, std::string *reply_body)
{
  bool tx = path.compare(0, 4, "/tx/") == 0;

  if (path == "/new-transaction" || path == "/new-snapshot") {
    proto::NewTransactionRequest request;
    if (!decode(body, &request))
      return false;
    std::map<std::string, Map> &sessions = path == "/new-transaction"
                                              ? txns
                                              : snapshots;
    proto::NewTransactionResponse reply;
    if (request.name().empty()
          || sessions.find(request.name()) != sessions.end())
      reply.set_error(ERR_INVALID);
    else
      sessions[request.name()] = data;
    encode(reply, reply_body);
    return true;
  }

  if (path == "/tx/get" || path == "/snap/get") {
    proto::GetRequest request;
    if (!decode(body, &request))
      return false;
    proto::GetResponse reply;
    Map *view = find_session(tx, tx ? request.transaction()
                                    : request.snapshot());
    if (!view)
      reply.set_error(tx ? ERR_NO_TXN : ERR_NO_SNAP);
    else {
      Map::iterator it = view->find(request.key());
      if (it == view->end())
        reply.set_error(ERR_NOT_EXIST);
      else
        reply.set_value(it->second);
    }
    encode(reply, reply_body);
    return true;
  }

  if (path == "/tx/set") {
    proto::SetRequest request;
    if (!decode(body, &request))
      return false;
    proto::SetResponse reply;
    Map *view = find_session(true, request.transaction());
    if (!view)
      reply.set_error(ERR_NO_TXN);
    else if (request.key().empty())
      reply.set_error(ERR_INVALID);
    else
      (*view)[request.key()] = request.value();
    encode(reply, reply_body);
    return true;
  }

  if (path == "/tx/delete") {
    proto::DeleteRequest request;
    if (!decode(body, &request))
      return false;
    proto::DeleteResponse reply;
    Map *view = find_session(true, request.transaction());
    if (!view)
      reply.set_error(ERR_NO_TXN);
    else
      view->erase(request.key());
    encode(reply, reply_body);
    return true;
  }

  if (path == "/tx/ascend" || path == "/tx/descend"
        || path == "/snap/ascend" || path == "/snap/descend") {
    proto::RangeRequest request;
    if (!decode(body, &request))
      return false;
    proto::RangeResponse reply;
    std::string id = tx ? request.transaction() : request.snapshot();
    Map *view = find_session(tx, id);
    if (!view)
      reply.set_error(tx ? ERR_NO_TXN : ERR_NO_SNAP);
    else
      reply.set_error(open_iterator(*view, id, request.name(),
                              request.begin(), request.end(),
                              path.find("descend") != std::string::npos));
    encode(reply, reply_body);
    return true;
  }

  if (path == "/tx/scan" || path == "/snap/scan") {
    proto::ScanRequest request;
    if (!decode(body, &request))
      return false;
    proto::ScanResponse reply;
    std::string id = tx ? request.transaction() : request.snapshot();
    Map *view = find_session(tx, id);
    if (!view)
      reply.set_error(tx ? ERR_NO_TXN : ERR_NO_SNAP);
    else
      reply.set_error(open_iterator(*view, id, request.name(), "", "",
                              false));
    encode(reply, reply_body);
    return true;
  }

  if (path == "/it/next") {
    proto::NextRequest request;
    if (!decode(body, &request))
      return false;
    proto::NextResponse reply;
    std::map<std::string, Iterator>::iterator it =
            iterators.find(request.iterator());
    if (it == iterators.end())
      reply.set_error(ERR_NO_ITERATOR);
    else if (it->second.position == it->second.entries.size())
      iterators.erase(it);
    else {
      const std::pair<std::string, std::string> &e =
              it->second.entries[it->second.position++];
      reply.set_key(e.first);
      reply.set_value(e.second);
    }
    encode(reply, reply_body);
    return true;
  }

  if (path == "/tx/commit" || path == "/tx/rollback") {
    proto::CommitRequest request;
    if (!decode(body, &request))
      return false;
    proto::CommitResponse reply;
    Map *view = find_session(true, request.transaction());
    if (!view)
      reply.set_error(ERR_NO_TXN);
    else {
      if (path == "/tx/commit")
        data = *view;
      close_iterators(request.transaction());
      txns.erase(request.transaction());
    }
    encode(reply, reply_body);
    return true;
  }

  if (path == "/snap/discard") {
    proto::DiscardRequest request;
    if (!decode(body, &request))
      return false;
    proto::DiscardResponse reply;
    if (!find_session(false, request.snapshot()))
      reply.set_error(ERR_NO_SNAP);
    else {
      close_iterators(request.snapshot());
      snapshots.erase(request.snapshot());
    }
    encode(reply, reply_body);
    return true;
  }

  *status = 404;
  *reply_body = "404 page not found\n";
  return true;
}
