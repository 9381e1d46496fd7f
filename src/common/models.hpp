#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "common/enums.hpp"

namespace apwatch {

using Timestamp = std::chrono::system_clock::time_point;

// One access point radio: the syslog host plus the hostapd interface name.
struct Station {
    std::string hostname;
    std::string interfaceName;
};

inline bool operator==(const Station &a, const Station &b)
{
    return a.hostname == b.hostname && a.interfaceName == b.interfaceName;
}

inline bool operator!=(const Station &a, const Station &b)
{
    return !(a == b);
}

inline bool operator<(const Station &a, const Station &b)
{
    return std::tie(a.hostname, a.interfaceName)
        < std::tie(b.hostname, b.interfaceName);
}

struct Device {
    // Current presence. Empty means the device is offline.
    std::set<Station> stations;

    std::optional<Timestamp> lastAssociated;
    std::optional<Timestamp> lastDisassociated;
    std::optional<Timestamp> lastObserved;

    bool isOnline() const
    {
        return !stations.empty();
    }
};

// Fixed fields of one syslog-ng format-json record.
struct LogEnvelope {
    std::string host;
    std::string program;
    Timestamp timestamp;
    std::string message;
};

struct PresenceEvent {
    Timestamp timestamp;
    Station station;
    // Canonical lowercase aa:bb:cc:dd:ee:ff form.
    std::string hardwareAddress;
    StationAction action = StationAction::Observed;
};

struct DeviceView {
    std::string hardwareAddress;
    Device device;
    bool online = false;
};

// Device entry inside the grouped maps; stations are implied by the grouping key.
struct DeviceSummary {
    std::string hardwareAddress;
    std::optional<Timestamp> lastAssociated;
    std::optional<Timestamp> lastDisassociated;
    std::optional<Timestamp> lastObserved;
};

struct DeviceFilter {
    DeviceFilterKind kind = DeviceFilterKind::All;
    std::string hostname;
    std::string interfaceName;

    static DeviceFilter all()
    {
        return DeviceFilter{};
    }

    static DeviceFilter online()
    {
        return DeviceFilter{DeviceFilterKind::Online, {}, {}};
    }

    static DeviceFilter offline()
    {
        return DeviceFilter{DeviceFilterKind::Offline, {}, {}};
    }

    static DeviceFilter byHostname(const std::string &hostname)
    {
        return DeviceFilter{DeviceFilterKind::Hostname, hostname, {}};
    }

    static DeviceFilter byInterface(const std::string &interfaceName)
    {
        return DeviceFilter{DeviceFilterKind::Interface, {}, interfaceName};
    }

    static DeviceFilter byStation(const std::string &hostname,
                                  const std::string &interfaceName)
    {
        return DeviceFilter{DeviceFilterKind::HostnameInterface, hostname, interfaceName};
    }
};

using StationsIndex = std::map<std::string, std::set<std::string>>;
using DeviceMap = std::map<std::string, std::vector<DeviceSummary>>;
using StationMap =
    std::map<std::string, std::map<std::string, std::vector<DeviceSummary>>>;

struct StoreStatus {
    std::optional<Timestamp> lastEventTimestamp;
    std::size_t deviceCount = 0;
    std::size_t onlineCount = 0;
};

} // namespace apwatch
