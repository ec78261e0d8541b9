/*
 * Copyright (C) 2005-2017 Christoph Rupp (chris@crupp.de).
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * See the file COPYING for License information.
 */

#include "0root/root.h"

#include <iterator>

#include "kvhttp/kvhttp.hpp"

// Always verify that a file of level N does not include headers > N!
#include "1base/cancel_state.h"
#include "1base/error.h"
#include "1base/version.h"
#include "1globals/globals.h"
#include "4cursor/cursor_remote.h"
#include "4db/db_remote.h"
#include "4txn/snapshot_remote.h"
#include "4txn/txn_remote.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

using namespace kvhttp;

const char * KVH_CALLCONV
kvh_strerror(kvh_status_t result)
{
  switch (result) {
    case KVH_SUCCESS:
      return "Success";
    case KVH_INV_PARAMETER:
      return "Invalid parameter";
    case KVH_KEY_NOT_FOUND:
      return "Key not found";
    case KVH_INTERNAL_ERROR:
      return "Internal error";
    case KVH_IO_ERROR:
      return "System I/O error";
    case KVH_TRANSPORT_ERROR:
      return "Transport error";
    case KVH_CANCELLED:
      return "Operation was cancelled";
    case KVH_PROTOCOL_ERROR:
      return "Invalid reply from server";
    case KVH_DOMAIN_ERROR:
      return "Server reported an error";
    case KVH_UNKNOWN_SESSION:
      return "Unknown transaction or snapshot";
    case KVH_UNKNOWN_CURSOR:
      return "Unknown cursor";
    default:
      return "Unknown error";
  }
}

int KVH_CALLCONV
kvh_is_domain_error(kvh_status_t status)
{
  switch (status) {
    case KVH_INV_PARAMETER:
    case KVH_KEY_NOT_FOUND:
    case KVH_DOMAIN_ERROR:
    case KVH_UNKNOWN_SESSION:
    case KVH_UNKNOWN_CURSOR:
      return 1;
    default:
      return 0;
  }
}

void KVH_CALLCONV
kvh_get_version(uint32_t *major, uint32_t *minor, uint32_t *revision)
{
  if (likely(major != 0))
    *major = KVH_VERSION_MAJ;
  if (likely(minor != 0))
    *minor = KVH_VERSION_MIN;
  if (likely(revision != 0))
    *revision = KVH_VERSION_REV;
}

void KVH_CALLCONV
kvh_set_error_handler(kvh_error_handler_fun f)
{
  if (f)
    kvhttp::Globals::ms_error_handler = f;
  else
    kvhttp::Globals::ms_error_handler = kvhttp::default_errhandler;
}

namespace kvhttp {

static error
make_error(const Exception &ex)
{
  return error(ex.code, ex.message, ex.http_status);
}

static void
check_handle(const void *handle, const char *name)
{
  if (unlikely(!handle)) {
    kvh_trace(("%s handle is NULL", name));
    throw error(KVH_INV_PARAMETER, std::string(name) + " is not open");
  }
}

//
// context
//

context::context()
  : _state(new CancelState)
{
}

context::~context()
{
  delete _state;
}

void
context::cancel()
{
  _state->cancel();
}

bool
context::is_cancelled() const
{
  return _state->is_cancelled();
}

void
context::set_timeout(uint32_t millis)
{
  _state->set_timeout(millis);
}

long
context::get_remaining_millis() const
{
  return _state->remaining_millis();
}

//
// cursor
//

cursor::~cursor()
{
  delete _cursor;
}

cursor &
cursor::operator=(cursor &&other)
{
  if (this != &other) {
    delete _cursor;
    _cursor = other._cursor;
    _error = other._error;
    other._cursor = 0;
  }
  return *this;
}

bool
cursor::next(std::string *key, std::string *value, context *ctx)
{
  if (unlikely(!_cursor)) {
    _error = error(KVH_INV_PARAMETER, "cursor is not open");
    return false;
  }

  // |key| and |value| can be NULL if the caller is not interested
  std::string k, v;
  try {
    if (!_cursor->next(ctx, key ? key : &k, value ? value : &v))
      return false;
  }
  catch (Exception &ex) {
    _error = make_error(ex);
    return false;
  }
  return true;
}

std::string
cursor::get_id() const
{
  return _cursor ? _cursor->id : std::string();
}

// creates a public cursor from a RemoteCursor factory call
#define MAKE_CURSOR(expr)                                                     \
  do {                                                                        \
    try {                                                                     \
      return cursor(expr);                                                    \
    }                                                                         \
    catch (Exception &ex) {                                                   \
      throw make_error(ex);                                                   \
    }                                                                         \
  } while (0)

//
// txn
//

txn::~txn()
{
  delete _txn;
}

txn &
txn::operator=(txn &&other)
{
  if (this != &other) {
    delete _txn;
    _txn = other._txn;
    other._txn = 0;
  }
  return *this;
}

std::string
txn::get(const std::string &key, context *ctx)
{
  check_handle(_txn, "transaction");
  try {
    return _txn->get(ctx, key);
  }
  catch (Exception &ex) {
    throw make_error(ex);
  }
}

void
txn::set(const std::string &key, const std::string &value, context *ctx)
{
  check_handle(_txn, "transaction");
  try {
    _txn->set(ctx, key, &value);
  }
  catch (Exception &ex) {
    throw make_error(ex);
  }
}

void
txn::set(const std::string &key, std::istream *value, context *ctx)
{
  check_handle(_txn, "transaction");
  if (unlikely(!value)) {
    kvh_trace(("parameter 'value' must not be NULL"));
    throw error(KVH_INV_PARAMETER, "value must not be NULL");
  }
  if (unlikely(!*value)) {
    kvh_log(("value stream is not readable"));
    throw error(KVH_IO_ERROR, "value stream is not readable");
  }

  std::string data((std::istreambuf_iterator<char>(*value)),
                  std::istreambuf_iterator<char>());
  if (unlikely(value->bad())) {
    kvh_log(("failed to read the value stream"));
    throw error(KVH_IO_ERROR, "failed to read the value stream");
  }

  set(key, data, ctx);
}

void
txn::erase(const std::string &key, context *ctx)
{
  check_handle(_txn, "transaction");
  try {
    _txn->erase(ctx, key);
  }
  catch (Exception &ex) {
    throw make_error(ex);
  }
}

cursor
txn::ascend(const std::string &begin, const std::string &end)
{
  check_handle(_txn, "transaction");
  MAKE_CURSOR(_txn->ascend(begin, end));
}

cursor
txn::descend(const std::string &begin, const std::string &end)
{
  check_handle(_txn, "transaction");
  MAKE_CURSOR(_txn->descend(begin, end));
}

cursor
txn::scan()
{
  check_handle(_txn, "transaction");
  MAKE_CURSOR(_txn->scan());
}

void
txn::commit(context *ctx)
{
  check_handle(_txn, "transaction");
  try {
    _txn->commit(ctx);
  }
  catch (Exception &ex) {
    throw make_error(ex);
  }
}

void
txn::rollback(context *ctx)
{
  check_handle(_txn, "transaction");
  try {
    _txn->rollback(ctx);
  }
  catch (Exception &ex) {
    throw make_error(ex);
  }
}

std::string
txn::get_id() const
{
  return _txn ? _txn->id : std::string();
}

//
// snapshot
//

snapshot::~snapshot()
{
  delete _snap;
}

snapshot &
snapshot::operator=(snapshot &&other)
{
  if (this != &other) {
    delete _snap;
    _snap = other._snap;
    other._snap = 0;
  }
  return *this;
}

std::string
snapshot::get(const std::string &key, context *ctx)
{
  check_handle(_snap, "snapshot");
  try {
    return _snap->get(ctx, key);
  }
  catch (Exception &ex) {
    throw make_error(ex);
  }
}

cursor
snapshot::ascend(const std::string &begin, const std::string &end)
{
  check_handle(_snap, "snapshot");
  MAKE_CURSOR(_snap->ascend(begin, end));
}

cursor
snapshot::descend(const std::string &begin, const std::string &end)
{
  check_handle(_snap, "snapshot");
  MAKE_CURSOR(_snap->descend(begin, end));
}

cursor
snapshot::scan()
{
  check_handle(_snap, "snapshot");
  MAKE_CURSOR(_snap->scan());
}

void
snapshot::discard(context *ctx)
{
  check_handle(_snap, "snapshot");
  try {
    _snap->discard(ctx);
  }
  catch (Exception &ex) {
    throw make_error(ex);
  }
}

std::string
snapshot::get_id() const
{
  return _snap ? _snap->id : std::string();
}

//
// db
//

db::~db()
{
  close();
}

void
db::open(const char *url, http_client *client, const kvh_parameter_t *param)
{
  close();
  try {
    _db = new RemoteDb(url, client, param);
  }
  catch (Exception &ex) {
    throw make_error(ex);
  }
}

txn
db::begin_transaction(context *ctx)
{
  check_handle(_db, "database");
  try {
    return txn(_db->begin_transaction(ctx));
  }
  catch (Exception &ex) {
    throw make_error(ex);
  }
}

snapshot
db::begin_snapshot(context *ctx)
{
  check_handle(_db, "database");
  try {
    return snapshot(_db->begin_snapshot(ctx));
  }
  catch (Exception &ex) {
    throw make_error(ex);
  }
}

std::string
db::get_server_url() const
{
  check_handle(_db, "database");
  return _db->server_url();
}

void
db::get_parameters(kvh_parameter_t *param) const
{
  check_handle(_db, "database");
  try {
    _db->config.get_parameters(param);
  }
  catch (Exception &ex) {
    throw make_error(ex);
  }
}

void
db::close()
{
  delete _db;
  _db = 0;
}

} // namespace kvhttp
