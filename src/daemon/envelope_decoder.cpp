#include "daemon/envelope_decoder.hpp"

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

namespace apwatch {

namespace {

std::string requireString(const nlohmann::json &record, const char *key)
{
    auto it = record.find(key);
    if (it == record.end()) {
        throw DecodeError(std::string("missing field '") + key + "'");
    }
    if (!it->is_string()) {
        throw DecodeError(std::string("field '") + key + "' is not a string");
    }
    return it->get<std::string>();
}

} // namespace

LogEnvelope decodeEnvelope(const std::string &line)
{
    const auto record = nlohmann::json::parse(line, nullptr, false);
    if (record.is_discarded()) {
        throw DecodeError("invalid JSON");
    }
    if (!record.is_object()) {
        throw DecodeError("record is not a JSON object");
    }

    LogEnvelope envelope;
    envelope.host = requireString(record, "host");
    envelope.program = requireString(record, "program");
    envelope.message = requireString(record, "message");

    const std::string timestampText = requireString(record, "timestamp");
    const auto timestamp = fromRfc3339(timestampText);
    if (!timestamp.has_value()) {
        throw DecodeError("field 'timestamp' is not RFC3339: " + timestampText);
    }
    envelope.timestamp = *timestamp;

    return envelope;
}

} // namespace apwatch
