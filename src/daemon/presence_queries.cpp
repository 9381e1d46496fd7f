#include "daemon/presence_queries.hpp"

#include <algorithm>

namespace apwatch {

namespace {

DeviceView makeView(const std::string &hardwareAddress, const Device &device)
{
    DeviceView view;
    view.hardwareAddress = hardwareAddress;
    view.device = device;
    view.online = device.isOnline();
    return view;
}

DeviceSummary makeSummary(const std::string &hardwareAddress, const Device &device)
{
    DeviceSummary summary;
    summary.hardwareAddress = hardwareAddress;
    summary.lastAssociated = device.lastAssociated;
    summary.lastDisassociated = device.lastDisassociated;
    summary.lastObserved = device.lastObserved;
    return summary;
}

bool matchesFilter(const Device &device, const DeviceFilter &filter)
{
    switch (filter.kind) {
    case DeviceFilterKind::All:
        return true;
    case DeviceFilterKind::Online:
        return device.isOnline();
    case DeviceFilterKind::Offline:
        return !device.isOnline();
    case DeviceFilterKind::Hostname:
        return std::any_of(device.stations.begin(), device.stations.end(),
                           [&filter](const Station &station) {
                               return station.hostname == filter.hostname;
                           });
    case DeviceFilterKind::Interface:
        return std::any_of(device.stations.begin(), device.stations.end(),
                           [&filter](const Station &station) {
                               return station.interfaceName == filter.interfaceName;
                           });
    case DeviceFilterKind::HostnameInterface:
        return device.stations.count(Station{filter.hostname, filter.interfaceName}) > 0;
    }
    return false;
}

} // namespace

std::optional<DeviceView> findDevice(const PresenceState &state,
                                     const std::string &hardwareAddress)
{
    const auto &devices = state.devices();
    auto it = devices.find(hardwareAddress);
    if (it == devices.end()) {
        return std::nullopt;
    }
    return makeView(it->first, it->second);
}

std::vector<DeviceView> listDevices(const PresenceState &state,
                                    const DeviceFilter &filter)
{
    std::vector<DeviceView> views;
    for (const auto &[address, device] : state.devices()) {
        if (matchesFilter(device, filter)) {
            views.push_back(makeView(address, device));
        }
    }
    return views;
}

std::set<std::string> accessPoints(const PresenceState &state)
{
    std::set<std::string> hostnames;
    for (const auto &entry : state.devices()) {
        for (const auto &station : entry.second.stations) {
            hostnames.insert(station.hostname);
        }
    }
    return hostnames;
}

StationsIndex stationsIndex(const PresenceState &state)
{
    StationsIndex index;
    for (const auto &entry : state.devices()) {
        for (const auto &station : entry.second.stations) {
            index[station.hostname].insert(station.interfaceName);
        }
    }
    return index;
}

DeviceMap deviceMap(const PresenceState &state)
{
    DeviceMap map;
    for (const auto &[address, device] : state.devices()) {
        // A device on two radios of the same host is listed once for that host.
        std::set<std::string> hostnames;
        for (const auto &station : device.stations) {
            hostnames.insert(station.hostname);
        }
        for (const auto &hostname : hostnames) {
            map[hostname].push_back(makeSummary(address, device));
        }
    }
    return map;
}

StationMap stationMap(const PresenceState &state)
{
    StationMap map;
    for (const auto &[address, device] : state.devices()) {
        for (const auto &station : device.stations) {
            map[station.hostname][station.interfaceName].push_back(
                makeSummary(address, device));
        }
    }
    return map;
}

StoreStatus storeStatus(const PresenceState &state)
{
    StoreStatus status;
    status.lastEventTimestamp = state.lastEventTimestamp();
    status.deviceCount = state.devices().size();
    status.onlineCount = static_cast<std::size_t>(
        std::count_if(state.devices().begin(), state.devices().end(),
                      [](const auto &entry) { return entry.second.isOnline(); }));
    return status;
}

} // namespace apwatch
