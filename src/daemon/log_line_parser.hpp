#pragma once

#include <optional>
#include <string>

#include "common/models.hpp"

namespace apwatch {

constexpr const char kDefaultApProgram[] = "hostapd";

enum class LineStatus {
    Event,
    // Record from a program other than the AP daemon.
    NotApplicable,
    // AP daemon message with no presence meaning.
    Ignored,
    GrammarError
};

struct LineParseResult {
    LineStatus status = LineStatus::NotApplicable;
    std::optional<PresenceEvent> event;
    LogEnvelope envelope;
    // Grammar failure reason when status is GrammarError.
    std::string error;
};

/**
 * Decode a syslog-ng JSON line and, when it comes from apProgram, parse its
 * message into a PresenceEvent. The station is (envelope host, interface).
 *
 * Throws DecodeError when the line itself cannot be decoded.
 */
LineParseResult parseLogLine(const std::string &line,
                             const std::string &apProgram = kDefaultApProgram);

} // namespace apwatch
