#include "entry_codec.hpp"
#include <google/protobuf/util/json_util.h>
#include <cmath>
#include <cstdint>
#include <stdexcept>

double EntryCodec::toEpochSeconds(std::chrono::system_clock::time_point timestamp) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(timestamp.time_since_epoch());
    return static_cast<double>(micros.count()) / 1e6;
}

std::chrono::system_clock::time_point EntryCodec::fromEpochSeconds(double seconds) {
    auto micros = std::chrono::microseconds(static_cast<int64_t>(std::llround(seconds * 1e6)));
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(micros));
}

logflux::v1::LogEntry EntryCodec::toProto(const LogEntry& entry) {
    logflux::v1::LogEntry proto;
    proto.set_node(entry.node());
    proto.set_payload(entry.payload());
    proto.set_loglevel(log_level::toValue(entry.level()));
    proto.set_timestamp(toEpochSeconds(entry.timestamp()));
    proto.set_encryption_mode(entry.encryptionMode());
    proto.set_iv(entry.iv());
    proto.set_salt(entry.salt());
    return proto;
}

LogEntry EntryCodec::fromProto(const logflux::v1::LogEntry& proto) {
    return LogEntry(proto.node(),
                    proto.payload(),
                    log_level::fromValue(proto.loglevel()),
                    fromEpochSeconds(proto.timestamp()),
                    proto.encryption_mode(),
                    proto.iv(),
                    proto.salt());
}

std::string EntryCodec::toJson(const LogEntry& entry) {
    google::protobuf::util::JsonPrintOptions options;
    options.always_print_primitive_fields = true;
    options.preserve_proto_field_names = true;

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(toProto(entry), &json, options);
    if (!status.ok()) {
        throw std::runtime_error("Failed to serialize log entry: " + status.ToString());
    }
    return json;
}

LogEntry EntryCodec::fromJson(const std::string& json) {
    logflux::v1::LogEntry proto;
    auto status = google::protobuf::util::JsonStringToMessage(json, &proto);
    if (!status.ok()) {
        throw std::runtime_error("Invalid log entry JSON: " + status.ToString());
    }
    return fromProto(proto);
}

DeliveryReceipt EntryCodec::parseReceipt(int http_status, const std::string& body) {
    DeliveryReceipt receipt;
    receipt.http_status = http_status;
    if (body.empty()) {
        return receipt;
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    logflux::v1::LogResponse response;
    auto status = google::protobuf::util::JsonStringToMessage(body, &response, options);
    if (!status.ok()) {
        return receipt;
    }

    receipt.status = response.status();
    receipt.id = response.id();
    receipt.timestamp = response.timestamp();
    receipt.message = response.message();
    return receipt;
}
