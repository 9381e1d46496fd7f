#pragma once

#include <optional>
#include <string>

#include "common/models.hpp"

namespace apwatch {

enum class GrammarStatus {
    // A station event was recognised.
    Event,
    // A known hostapd message that carries no presence information.
    NoEvent,
    // Not a message this grammar knows.
    Error
};

struct GrammarResult {
    GrammarStatus status = GrammarStatus::Error;
    std::string interfaceName;
    std::string hardwareAddress;
    StationAction action = StationAction::Observed;
    // Set when status is Error.
    std::string error;
};

/**
 * Parse a hostapd station message of the form
 *
 *   <interface>: STA <aa:bb:cc:dd:ee:ff> <action text>
 *
 * e.g. "wl1.1: STA 32:42:fd:88:86:0c IEEE 802.11: associated".
 * The hardware address is returned in canonical lowercase form.
 */
GrammarResult parseStationMessage(const std::string &message);

// Parse a complete hardware address (six two-digit hex groups separated by ':',
// any case). Returns the lowercase form, or std::nullopt.
std::optional<std::string> parseHardwareAddress(const std::string &text);

} // namespace apwatch
