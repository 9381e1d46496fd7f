#pragma once

#include <map>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace apwatch {

// Unsynchronised presence index. PresenceStore owns one instance and guards
// every access with its mutex.
class PresenceState {
public:
    // Apply one event. Devices are created on first mention and never removed.
    void witness(const PresenceEvent &event);

    const std::map<std::string, Device> &devices() const
    {
        return m_devices;
    }

    std::optional<Timestamp> lastEventTimestamp() const
    {
        return m_lastEventTimestamp;
    }

private:
    std::map<std::string, Device> m_devices;
    std::optional<Timestamp> m_lastEventTimestamp;
};

} // namespace apwatch
