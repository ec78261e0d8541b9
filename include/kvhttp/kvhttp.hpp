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

/**
 * @file kvhttp.hpp
 * @version 1.0.0
 *
 * The C++ API of the kvhttp client. It does not attempt to be STL
 * compatible.
 *
 * All functions throw exceptions of class @sa kvhttp::error in case of an
 * error, with the exception of kvhttp::cursor::next(), which reports
 * failures through its return value and kvhttp::cursor::get_error().
 *
 * A kvhttp::db must outlive all transactions, snapshots and cursors that
 * were created from it. None of the objects is thread-safe; use one object
 * per thread, or serialize the access.
 */

#ifndef KVH_KVHTTP_HPP
#define KVH_KVHTTP_HPP

#include <istream>
#include <string>

#include <kvhttp/kvhttp.h>
#include <kvhttp/http_client.hpp>

/**
 * The global kvhttp namespace.
 */
namespace kvhttp {

struct CancelState;
struct RemoteDb;
struct RemoteTxn;
struct RemoteSnapshot;
struct RemoteCursor;

/**
 * An error class.
 *
 * The kvhttp C++ API throws this class as Exceptions.
 */
class error {
  public:
    /** Constructor */
    error(kvh_status_t st = 0, const std::string &message = "",
                    long http_status = 0)
      : _status(st), _message(message), _http_status(http_status) {
    }

    /** Returns the error code. */
    kvh_status_t get_errno() const {
      return _status;
    }

    /** Returns an English error description. */
    const char *get_string() const {
      return kvh_strerror(_status);
    }

    /**
     * Returns the detailed message. For errors reported by the server
     * this is the verbatim text of the server.
     */
    const std::string &get_message() const {
      return _message;
    }

    /** Returns the HTTP status for KVH_TRANSPORT_ERROR, otherwise 0. */
    long get_http_status() const {
      return _http_status;
    }

  private:
    kvh_status_t _status;
    std::string _message;
    long _http_status;
};

/**
 * A cancellation context.
 *
 * Every operation accepts an optional context. A context can be
 * cancelled from another thread; the request that is currently in flight
 * is then aborted with KVH_CANCELLED. A context can also carry a deadline.
 */
class context {
  public:
    /** Constructor; the context is neither cancelled nor has a deadline */
    context();

    /** Destructor */
    ~context();

    /** Cancels the context; thread-safe */
    void cancel();

    /** Returns true if cancel() was called or the deadline expired */
    bool is_cancelled() const;

    /** Sets a deadline |millis| milliseconds from now */
    void set_timeout(uint32_t millis);

    /** Returns the milliseconds till the deadline, or -1 if there is none */
    long get_remaining_millis() const;

    /** Returns a pointer to the internal state. */
    CancelState *get_handle() {
      return _state;
    }

  private:
    context(const context &);
    context &operator=(const context &);

    CancelState *_state;
};

/**
 * A Cursor class.
 *
 * A cursor iterates over a range of keys of a transaction or snapshot.
 * The iteration state is kept on the server. Each call to next() is a
 * round trip to the server; results are not cached.
 *
 * A cursor can only move forward. To restart an iteration create a new
 * cursor. It is not necessary to read the cursor till the end.
 *
 * Only the kvhttp::db has to outlive the cursor. The txn or snapshot
 * which created it can be destroyed or reassigned while the cursor is
 * still in use; the cursor then keeps addressing the same server-side
 * session.
 */
class cursor {
  public:
    /** Constructor */
    cursor(RemoteCursor *c = 0)
      : _cursor(c) {
    }

    /** Move constructor */
    cursor(cursor &&other)
      : _cursor(other._cursor), _error(other._error) {
      other._cursor = 0;
    }

    /** Destructor; does not contact the server */
    ~cursor();

    /** Move assignment; transfers the ownership of the cursor */
    cursor &operator=(cursor &&other);

    /**
     * Retrieves the next entry. Opens the cursor on the server if this
     * is the first call.
     *
     * @return true if |key| and |value| were filled; false at the end of
     *      the range or if an error occurred (see is_failed())
     */
    bool next(std::string *key, std::string *value, context *ctx = 0);

    /** Returns true if the cursor stopped because of an error */
    bool is_failed() const {
      return _error.get_errno() != 0;
    }

    /** Returns the error which stopped the cursor (status 0 if none) */
    const error &get_error() const {
      return _error;
    }

    /** Throws the error which stopped the cursor, if any */
    void check() const {
      if (is_failed())
        throw _error;
    }

    /** Returns the id of the server-side cursor */
    std::string get_id() const;

    /** Returns a pointer to the internal cursor structure. */
    RemoteCursor *get_handle() {
      return _cursor;
    }

  private:
    cursor(const cursor &);
    cursor &operator=(const cursor &);

    RemoteCursor *_cursor;
    error _error;
};

/**
 * A Transaction class
 *
 * The handle does not cache any data. After commit() or rollback() the
 * server no longer knows the transaction, and further operations fail
 * with KVH_UNKNOWN_SESSION.
 */
class txn {
  public:
    /** Constructor */
    txn(RemoteTxn *t = 0)
      : _txn(t) {
    }

    /** Move constructor */
    txn(txn &&other)
      : _txn(other._txn) {
      other._txn = 0;
    }

    /** Destructor; does not contact the server */
    ~txn();

    /** Move assignment; transfers the ownership of the handle */
    txn &operator=(txn &&other);

    /** Returns the value of |key|; throws KVH_KEY_NOT_FOUND if it does
     * not exist */
    std::string get(const std::string &key, context *ctx = 0);

    /** Inserts or overwrites a key/value pair */
    void set(const std::string &key, const std::string &value,
                    context *ctx = 0);

    /** Inserts or overwrites a key/value pair; the value is read from
     * |value| till the end of the stream. Throws KVH_INV_PARAMETER if
     * |value| is NULL. */
    void set(const std::string &key, std::istream *value, context *ctx = 0);

    /** Deletes a key */
    void erase(const std::string &key, context *ctx = 0);

    /** Returns a cursor over [begin, end) in ascending order; empty
     * bounds are unlimited */
    cursor ascend(const std::string &begin, const std::string &end);

    /** Returns a cursor over [begin, end) in descending order */
    cursor descend(const std::string &begin, const std::string &end);

    /** Returns a cursor over all keys in the server's order */
    cursor scan();

    /** Commits the Txn */
    void commit(context *ctx = 0);

    /** Rolls back the Txn */
    void rollback(context *ctx = 0);

    /** Returns the id of the Txn */
    std::string get_id() const;

    /** Returns a pointer to the internal transaction structure. */
    RemoteTxn *get_handle() {
      return _txn;
    }

  private:
    txn(const txn &);
    txn &operator=(const txn &);

    RemoteTxn *_txn;
};

/**
 * A read-only Snapshot class
 */
class snapshot {
  public:
    /** Constructor */
    snapshot(RemoteSnapshot *s = 0)
      : _snap(s) {
    }

    /** Move constructor */
    snapshot(snapshot &&other)
      : _snap(other._snap) {
      other._snap = 0;
    }

    /** Destructor; does not contact the server */
    ~snapshot();

    /** Move assignment; transfers the ownership of the handle */
    snapshot &operator=(snapshot &&other);

    /** Returns the value of |key|; throws KVH_KEY_NOT_FOUND if it does
     * not exist */
    std::string get(const std::string &key, context *ctx = 0);

    /** Returns a cursor over [begin, end) in ascending order */
    cursor ascend(const std::string &begin, const std::string &end);

    /** Returns a cursor over [begin, end) in descending order */
    cursor descend(const std::string &begin, const std::string &end);

    /** Returns a cursor over all keys in the server's order */
    cursor scan();

    /** Discards the Snapshot */
    void discard(context *ctx = 0);

    /** Returns the id of the Snapshot */
    std::string get_id() const;

    /** Returns a pointer to the internal snapshot structure. */
    RemoteSnapshot *get_handle() {
      return _snap;
    }

  private:
    snapshot(const snapshot &);
    snapshot &operator=(const snapshot &);

    RemoteSnapshot *_snap;
};

/**
 * A Database class.
 *
 * This class wraps the connection to a remote database.
 */
class db {
  public:
    /** Set error handler function. */
    static void set_errhandler(kvh_error_handler_fun f) {
      kvh_set_error_handler(f);
    }

    /** Retrieves the kvhttp library version. */
    static void get_version(uint32_t *major, uint32_t *minor,
                  uint32_t *revision) {
      kvh_get_version(major, minor, revision);
    }

    /** Constructor */
    db()
      : _db(0) {
    }

    /** Constructor; see open() */
    db(const char *url, http_client *client = 0,
                    const kvh_parameter_t *param = 0)
      : _db(0) {
      open(url, client, param);
    }

    /** Destructor - automatically closes the Database */
    ~db();

    /**
     * Opens a database at |url| ("http://host:port/path"). No request is
     * sent. If |client| is NULL then a libcurl client is created and owned
     * by the database; otherwise |client| is borrowed and must outlive
     * the database.
     */
    void open(const char *url, http_client *client = 0,
                    const kvh_parameter_t *param = 0);

    /** Begins a new transaction */
    txn begin_transaction(context *ctx = 0);

    /** Begins a new snapshot */
    snapshot begin_snapshot(context *ctx = 0);

    /** Returns the normalized base URL */
    std::string get_server_url() const;

    /** Retrieves the configuration parameters */
    void get_parameters(kvh_parameter_t *param) const;

    /** Closes the database; server-side sessions are not affected */
    void close();

    /** Returns a pointer to the internal database structure. */
    RemoteDb *get_handle() {
      return _db;
    }

  private:
    db(const db &);
    db &operator=(const db &);

    RemoteDb *_db;
};

} // namespace kvhttp

#endif /* KVH_KVHTTP_HPP */
