// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "records.h"
#include "spdlog/spdlog.h"

#include <google/protobuf/util/json_util.h>

using google::protobuf::util::JsonParseOptions;
using google::protobuf::util::JsonPrintOptions;
using google::protobuf::util::JsonStringToMessage;
using google::protobuf::util::MessageToJsonString;

bool RecordToJson(const google::protobuf::Message& record, std::string& json, bool pretty) {
    JsonPrintOptions option;
    option.add_whitespace = pretty;

    json.clear();
    auto status = MessageToJsonString(record, &json, option);
    if (!status.ok()) {
        spdlog::error("[Records] Failed to render {}: {}", record.GetTypeName(), status.ToString());
        return false;
    }
    return true;
}

bool RecordFromJson(const std::string& json, google::protobuf::Message& record) {
    JsonParseOptions option;
    option.ignore_unknown_fields = true;

    record.Clear();
    auto status = JsonStringToMessage(json, &record, option);
    if (!status.ok()) {
        spdlog::debug("[Records] Failed to parse {}: {}", record.GetTypeName(), status.ToString());
        return false;
    }
    return true;
}
