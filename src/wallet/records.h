// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef HDVAULT_RECORDS_H
#define HDVAULT_RECORDS_H

#include "records.pb.h"

#include <string>

/** Encrypted payload of a seed or an account secret, stored verbatim in records */
using CryptoPayload = google::protobuf::Struct;

/**
 * JSON rendering of a record. Field names follow the json_name
 * declared in records.proto, unset optional fields are omitted.
 */
bool RecordToJson(const google::protobuf::Message& record, std::string& json, bool pretty = false);

/** Parses JSON into a record, skipping unknown fields */
bool RecordFromJson(const std::string& json, google::protobuf::Message& record);

#endif // HDVAULT_RECORDS_H
