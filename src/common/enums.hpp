#pragma once

namespace apwatch {

enum class StationAction {
    Associated,
    Disassociated,
    Observed
};

enum class DeviceFilterKind {
    All,
    Online,
    Offline,
    Hostname,
    Interface,
    HostnameInterface
};

} // namespace apwatch
