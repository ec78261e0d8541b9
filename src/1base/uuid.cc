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

#define BOOST_ALL_NO_LIB // disable MSVC auto-linking
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

// Always verify that a file of level N does not include headers > N!
#include "1base/error.h"
#include "1base/uuid.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

std::string
Uuid::generate()
{
  // the generator is not thread-safe; a new one is seeded from the
  // operating system's entropy source for each id
  try {
    boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
  }
  catch (boost::uuids::entropy_error &ex) {
    kvh_log(("failed to generate an id: %s", ex.what()));
    throw Exception(KVH_INTERNAL_ERROR, ex.what());
  }
}

} // namespace kvhttp
