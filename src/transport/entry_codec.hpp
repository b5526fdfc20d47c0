#ifndef ENTRY_CODEC_HPP
#define ENTRY_CODEC_HPP

#include "../models/log_entry.hpp"
#include "delivery_port.hpp"
#include "log_entry.pb.h"
#include <chrono>
#include <string>

// Wire form of a LogEntry: the logflux.v1.LogEntry message, sent as JSON
// with snake_case field names and zero values printed.
class EntryCodec {
public:
    static logflux::v1::LogEntry toProto(const LogEntry& entry);

    // Throws std::invalid_argument if the message does not describe a valid entry
    static LogEntry fromProto(const logflux::v1::LogEntry& proto);

    // Throws std::runtime_error if protobuf cannot print the message
    static std::string toJson(const LogEntry& entry);

    // Throws std::runtime_error on malformed JSON, std::invalid_argument on
    // out-of-range field values
    static LogEntry fromJson(const std::string& json);

    // Seconds since epoch, microsecond precision
    static double toEpochSeconds(std::chrono::system_clock::time_point timestamp);
    static std::chrono::system_clock::time_point fromEpochSeconds(double seconds);

    // Never throws. An empty or unparseable body yields a receipt carrying
    // only the HTTP status. Unknown fields are ignored.
    static DeliveryReceipt parseReceipt(int http_status, const std::string& body);
};

#endif // ENTRY_CODEC_HPP
