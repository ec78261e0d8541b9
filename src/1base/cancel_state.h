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

/*
 * The internal state of a kvhttp::context
 *
 * The flag can be raised from any thread; the deadline is set by the owner
 * of the context before the context is used.
 *
 * @exception_safe: nothrow
 * @thread_safe: yes
 */

#ifndef KVH_CANCEL_STATE_H
#define KVH_CANCEL_STATE_H

#include "0root/root.h"

#define BOOST_ALL_NO_LIB // disable MSVC auto-linking
#include <boost/atomic.hpp>
#include <boost/chrono.hpp>

// Always verify that a file of level N does not include headers > N!

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

struct CancelState {
  typedef boost::chrono::steady_clock Clock;

  // Constructor
  CancelState()
    : cancelled(false), has_deadline(false), deadline_millis(0) {
  }

  // Raises the flag
  void cancel() {
    cancelled.store(true);
  }

  // Sets the deadline |millis| milliseconds from now
  void set_timeout(uint32_t millis) {
    deadline_millis.store(now_millis() + millis);
    has_deadline.store(true);
  }

  // Returns the milliseconds till the deadline (0 if it expired), or -1
  // if there is no deadline
  long remaining_millis() const {
    if (!has_deadline.load())
      return -1;
    int64_t deadline = deadline_millis.load();
    int64_t now = now_millis();
    return now >= deadline ? 0 : (long)(deadline - now);
  }

  // Returns true if the flag was raised or the deadline expired
  bool is_cancelled() const {
    return cancelled.load() || remaining_millis() == 0;
  }

  static int64_t now_millis() {
    return boost::chrono::duration_cast<boost::chrono::milliseconds>(
                    Clock::now().time_since_epoch()).count();
  }

  // true if cancel() was called
  boost::atomic<bool> cancelled;

  // true if set_timeout() was called
  boost::atomic<bool> has_deadline;

  // the deadline in milliseconds on the steady clock
  boost::atomic<int64_t> deadline_millis;
};

} // namespace kvhttp

#endif // KVH_CANCEL_STATE_H
