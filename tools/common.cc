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

#include <stdio.h>

#include <kvhttp/kvhttp.hpp>

#include "common.h"

void
print_banner(const char *program_name)
{
  uint32_t maj, min, rev;
  kvhttp::db::get_version(&maj, &min, &rev);

  printf("%s: kvhttp client %u.%u.%u\n", program_name, maj, min, rev);
}

void
release_session(kvhttp::snapshot &snap)
{
  if (!snap.get_handle())
    return;
  try {
    snap.discard();
  }
  catch (kvhttp::error &e) {
    // the session is already gone if the failure closed it
    if (e.get_errno() != KVH_UNKNOWN_SESSION)
      fprintf(stderr, "discard: %s\n", e.get_string());
  }
}

void
release_session(kvhttp::txn &txn)
{
  if (!txn.get_handle())
    return;
  try {
    txn.rollback();
  }
  catch (kvhttp::error &e) {
    if (e.get_errno() != KVH_UNKNOWN_SESSION)
      fprintf(stderr, "rollback: %s\n", e.get_string());
  }
}
