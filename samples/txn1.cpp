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

/**
 * A simple example, which writes a few key/value pairs in a transaction,
 * reads them back through a snapshot and iterates over them in both
 * directions. Expects the url of a running server as the first argument
 * (default: http://localhost:8080/db).
 */

#include <iostream>
#include <stdio.h> /* for snprintf() */
#include <kvhttp/kvhttp.hpp>

#define LOOP 10

static std::string
make_key(int i)
{
  char buf[16];
  snprintf(buf, sizeof(buf), "key%03d", i);
  return buf;
}

int
run_demo(const char *url) {
  kvhttp::db db(url);       /* the database connection */
  std::string key, value;

  /*
   * first step: insert LOOP key/value pairs in a transaction, then commit
   * the transaction
   */
  kvhttp::txn txn = db.begin_transaction();
  for (int i = 0; i < LOOP; i++)
    txn.set(make_key(i), std::string("value of ") + make_key(i));
  txn.commit();

  /*
   * now read the values through a snapshot
   */
  kvhttp::snapshot snap = db.begin_snapshot();
  for (int i = 0; i < LOOP; i++) {
    value = snap.get(make_key(i));
    if (value != std::string("value of ") + make_key(i)) {
      std::cerr << "snapshot::get() returned the wrong value" << std::endl;
      return (-1);
    }
  }

  /*
   * iterate over the second half of the keys; cursors are read until
   * next() returns false, then the error (if any) is checked
   */
  kvhttp::cursor cursor = snap.ascend(make_key(LOOP / 2), "");
  while (cursor.next(&key, &value))
    std::cout << key << ": " << value << std::endl;
  cursor.check();

  /* and the first half in reverse order */
  cursor = snap.descend("", make_key(LOOP / 2));
  while (cursor.next(&key, &value))
    std::cout << key << ": " << value << std::endl;
  cursor.check();

  snap.discard();

  /*
   * a key that was deleted can no longer be found
   */
  txn = db.begin_transaction();
  txn.erase(make_key(0));
  try {
    txn.get(make_key(0));
    std::cerr << "txn::get() found a deleted key" << std::endl;
    return (-1);
  }
  catch (kvhttp::error &e) {
    if (e.get_errno() != KVH_KEY_NOT_FOUND)
      throw;
  }
  txn.rollback();

  /*
   * we're done! the server-side sessions were closed; the destructors
   * release the local resources
   */
  std::cout << "success!" << std::endl;
  return (0);
}

int
main(int argc, char **argv)
{
  try {
    return (run_demo(argc > 1 ? argv[1] : "http://localhost:8080/db"));
  }
  catch (kvhttp::error &e) {
    std::cerr << "run_demo() failed with unexpected error "
          << e.get_errno() << " ('"
          << e.get_string() << "': " << e.get_message() << ")" << std::endl;
    return (-1);
  }
}
