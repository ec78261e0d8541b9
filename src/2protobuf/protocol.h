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
 * Abstraction layer for the remote protocol
 */

#ifndef KVH_PROTOCOL_H
#define KVH_PROTOCOL_H

#include "0root/root.h"

#include <string>

#include <google/protobuf/util/json_util.h>

// Always verify that a file of level N does not include headers > N!
#include "1base/error.h"
#include "2protobuf/messages.pb.h"

#ifndef KVH_ROOT_H
#  error "root.h was not included"
#endif

namespace kvhttp {

/*
 * the Protocol class maps the messages that are exchanged between
 * client and server to their JSON representation
 */
struct Protocol {
  /*
   * Packs a message into its JSON representation. Default values are
   * omitted. Throws KVH_INTERNAL_ERROR if the message cannot be encoded.
   */
  static void pack(const google::protobuf::Message &message,
                  std::string *json) {
    json->clear();
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = false;
    google::protobuf::util::Status st =
        google::protobuf::util::MessageToJsonString(message, json, options);
    if (unlikely(!st.ok())) {
      kvh_log(("failed to encode %s: %s",
                  message.GetTypeName().c_str(), st.ToString().c_str()));
      throw Exception(KVH_INTERNAL_ERROR,
                  "failed to encode request: " + st.ToString());
    }
  }

  /*
   * Unpacks a JSON document into |message|. Unknown fields are ignored,
   * missing fields keep their default values. Returns false if |json| is
   * not a valid encoding of the message.
   */
  static bool unpack(const std::string &json,
                  google::protobuf::Message *message) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    google::protobuf::util::Status st =
        google::protobuf::util::JsonStringToMessage(json, message, options);
    if (unlikely(!st.ok())) {
      kvh_trace(("failed to decode %s: %s",
                  message->GetTypeName().c_str(), st.ToString().c_str()));
      return false;
    }
    return true;
  }

  /* shutdown/free globally allocated memory */
  static void shutdown() {
    google::protobuf::ShutdownProtobufLibrary();
  }
};

} // namespace kvhttp

#endif // KVH_PROTOCOL_H
