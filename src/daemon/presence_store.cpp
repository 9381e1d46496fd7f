#include "daemon/presence_store.hpp"

#include <mutex>

#include "daemon/presence_queries.hpp"
#include "daemon/presence_state.hpp"

namespace apwatch {

struct PresenceStore::Impl {
    mutable std::mutex mutex;
    PresenceState state;
};

PresenceStore::PresenceStore()
    : impl(std::make_unique<Impl>())
{
}

PresenceStore::~PresenceStore() = default;

void PresenceStore::witness(const PresenceEvent &event)
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    impl->state.witness(event);
}

std::optional<DeviceView> PresenceStore::get(const std::string &hardwareAddress) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return findDevice(impl->state, hardwareAddress);
}

std::vector<DeviceView> PresenceStore::list(const DeviceFilter &filter) const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return listDevices(impl->state, filter);
}

std::set<std::string> PresenceStore::accessPoints() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return apwatch::accessPoints(impl->state);
}

StationsIndex PresenceStore::stationsIndex() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return apwatch::stationsIndex(impl->state);
}

DeviceMap PresenceStore::deviceMap() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return apwatch::deviceMap(impl->state);
}

StationMap PresenceStore::stationMap() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return apwatch::stationMap(impl->state);
}

std::optional<Timestamp> PresenceStore::lastEventTimestamp() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return impl->state.lastEventTimestamp();
}

StoreStatus PresenceStore::status() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    return storeStatus(impl->state);
}

} // namespace apwatch
