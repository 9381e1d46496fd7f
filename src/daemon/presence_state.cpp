#include "daemon/presence_state.hpp"

namespace apwatch {

void PresenceState::witness(const PresenceEvent &event)
{
    Device &device = m_devices[event.hardwareAddress];

    // Timestamps follow arrival order, which is log order; no max() comparison.
    switch (event.action) {
    case StationAction::Associated:
        device.lastAssociated = event.timestamp;
        device.stations.insert(event.station);
        break;
    case StationAction::Observed:
        device.lastObserved = event.timestamp;
        device.stations.insert(event.station);
        break;
    case StationAction::Disassociated:
        device.lastDisassociated = event.timestamp;
        device.stations.erase(event.station);
        break;
    }

    m_lastEventTimestamp = event.timestamp;
}

} // namespace apwatch
