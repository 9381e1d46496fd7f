#include "daemon/message_grammar.hpp"

#include <cstring>

namespace apwatch {

namespace {

constexpr const char kInterfaceDelimiter[] = ": ";
constexpr const char kStationTag[] = "STA ";
constexpr int kAddressGroups = 6;

struct Alternative {
    const char *literal;
    GrammarStatus status;
    StationAction action;
};

// Tried in order after "<interface>: STA <address> "; first prefix match wins.
// The literals are mutually exclusive prefixes.
constexpr Alternative kAlternatives[] = {
    {"IEEE 802.11: associated", GrammarStatus::Event, StationAction::Associated},
    {"IEEE 802.11: disassociated", GrammarStatus::Event, StationAction::Disassociated},
    {"WPA: pairwise key handshake completed (RSN)", GrammarStatus::Event, StationAction::Observed},
    {"WPA: group key handshake completed (RSN)", GrammarStatus::Event, StationAction::Observed},
    {"RADIUS: starting accounting session", GrammarStatus::NoEvent, StationAction::Observed},
};

int hexValue(char ch)
{
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

bool startsWithAt(const std::string &text, size_t pos, const char *literal)
{
    return pos <= text.size()
        && text.compare(pos, std::strlen(literal), literal) == 0;
}

// Reads an address starting at pos. On success returns the canonical form and
// advances pos past the last hex digit.
std::optional<std::string> readHardwareAddress(const std::string &text, size_t &pos)
{
    static const char kHexDigits[] = "0123456789abcdef";

    std::string canonical;
    canonical.reserve(17);
    size_t cursor = pos;

    for (int group = 0; group < kAddressGroups; ++group) {
        if (group > 0) {
            if (cursor >= text.size() || text[cursor] != ':') {
                return std::nullopt;
            }
            canonical.push_back(':');
            ++cursor;
        }
        if (cursor + 2 > text.size()) {
            return std::nullopt;
        }
        const int high = hexValue(text[cursor]);
        const int low = hexValue(text[cursor + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        canonical.push_back(kHexDigits[high]);
        canonical.push_back(kHexDigits[low]);
        cursor += 2;
    }

    pos = cursor;
    return canonical;
}

GrammarResult grammarError(const std::string &reason)
{
    GrammarResult result;
    result.status = GrammarStatus::Error;
    result.error = reason;
    return result;
}

} // namespace

std::optional<std::string> parseHardwareAddress(const std::string &text)
{
    size_t pos = 0;
    auto address = readHardwareAddress(text, pos);
    if (!address.has_value() || pos != text.size()) {
        return std::nullopt;
    }
    return address;
}

GrammarResult parseStationMessage(const std::string &message)
{
    const size_t delimiter = message.find(kInterfaceDelimiter);
    if (delimiter == std::string::npos) {
        return grammarError("missing interface delimiter");
    }
    const std::string interfaceName = message.substr(0, delimiter);
    size_t pos = delimiter + std::strlen(kInterfaceDelimiter);

    if (!startsWithAt(message, pos, kStationTag)) {
        return grammarError("expected 'STA' after interface");
    }
    pos += std::strlen(kStationTag);

    auto address = readHardwareAddress(message, pos);
    if (!address.has_value()) {
        return grammarError("malformed hardware address");
    }

    // At least one blank separates the address from the action text.
    const size_t actionStart = message.find_first_not_of(" \t", pos);
    if (actionStart == pos || actionStart == std::string::npos) {
        return grammarError("expected whitespace after hardware address");
    }

    for (const auto &alternative : kAlternatives) {
        if (!startsWithAt(message, actionStart, alternative.literal)) {
            continue;
        }
        GrammarResult result;
        result.status = alternative.status;
        if (alternative.status == GrammarStatus::Event) {
            result.interfaceName = interfaceName;
            result.hardwareAddress = *address;
            result.action = alternative.action;
        }
        return result;
    }

    return grammarError("unrecognised station action");
}

} // namespace apwatch
