#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/presence_state.hpp"

namespace apwatch {

// Read-only projections over a PresenceState. Every result is a copy; nothing
// returned refers back into the state. Keys and lists follow byte-wise string
// order so API output is stable.

std::optional<DeviceView> findDevice(const PresenceState &state,
                                     const std::string &hardwareAddress);

std::vector<DeviceView> listDevices(const PresenceState &state,
                                    const DeviceFilter &filter);

// Distinct hostnames that currently have at least one associated device.
std::set<std::string> accessPoints(const PresenceState &state);

// hostname -> interfaces with at least one associated device.
StationsIndex stationsIndex(const PresenceState &state);

// hostname -> devices currently associated there. Offline devices never appear.
DeviceMap deviceMap(const PresenceState &state);

// hostname -> interface -> devices currently on that exact station.
StationMap stationMap(const PresenceState &state);

StoreStatus storeStatus(const PresenceState &state);

} // namespace apwatch
