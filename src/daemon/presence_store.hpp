#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace apwatch {

// PresenceStore is the process-wide presence index shared between the
// ingestion thread (the single writer) and API request handlers (readers).
// One mutex serialises everything: each witness() and each query holds it for
// its whole body, so readers never see a half-applied event.
class PresenceStore {
public:
    PresenceStore();
    ~PresenceStore();

    PresenceStore(const PresenceStore &) = delete;
    PresenceStore &operator=(const PresenceStore &) = delete;

    void witness(const PresenceEvent &event);

    // Query API used by the HTTP server. Results are copies.
    std::optional<DeviceView> get(const std::string &hardwareAddress) const;
    std::vector<DeviceView> list(const DeviceFilter &filter) const;
    std::set<std::string> accessPoints() const;
    StationsIndex stationsIndex() const;
    DeviceMap deviceMap() const;
    StationMap stationMap() const;

    // Staleness input for the watchdog.
    std::optional<Timestamp> lastEventTimestamp() const;
    StoreStatus status() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace apwatch
