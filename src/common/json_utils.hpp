#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <QDateTime>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace apwatch {

inline std::string toIso8601Utc(Timestamp timestamp)
{
    const qint64 millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                              timestamp.time_since_epoch())
                              .count();
    const QDateTime dt = QDateTime::fromMSecsSinceEpoch(millis, Qt::UTC);
    // Whole seconds keep the short form syslog-ng itself writes.
    if (millis % 1000 == 0) {
        return dt.toString(Qt::ISODate).toStdString();
    }
    return dt.toString(Qt::ISODateWithMs).toStdString();
}

// Accepts RFC3339 timestamps: a 'Z' or numeric offset is required,
// fractional seconds are optional.
inline std::optional<Timestamp> fromRfc3339(const std::string &value)
{
    const QDateTime dt =
        QDateTime::fromString(QString::fromStdString(value), Qt::ISODateWithMs);
    if (!dt.isValid() || dt.timeSpec() == Qt::LocalTime) {
        return std::nullopt;
    }
    return Timestamp{std::chrono::milliseconds{dt.toMSecsSinceEpoch()}};
}

inline std::string toActionString(StationAction action)
{
    switch (action) {
    case StationAction::Associated:
        return "associated";
    case StationAction::Disassociated:
        return "disassociated";
    case StationAction::Observed:
        return "observed";
    }
    return "observed";
}

inline nlohmann::json optionalTimestampJson(const std::optional<Timestamp> &timestamp)
{
    if (!timestamp.has_value()) {
        return nullptr;
    }
    return toIso8601Utc(*timestamp);
}

inline void to_json(nlohmann::json &j, const StationAction &action)
{
    j = toActionString(action);
}

inline void to_json(nlohmann::json &j, const Station &station)
{
    j = nlohmann::json{
        {"hostname", station.hostname},
        {"interface", station.interfaceName}
    };
}

inline void to_json(nlohmann::json &j, const DeviceView &view)
{
    nlohmann::json stations = nlohmann::json::array();
    for (const auto &station : view.device.stations) {
        stations.push_back(station);
    }

    j = nlohmann::json{
        {"hardware_ethernet", view.hardwareAddress},
        {"stations", stations},
        {"last_associated", optionalTimestampJson(view.device.lastAssociated)},
        {"last_disassociated", optionalTimestampJson(view.device.lastDisassociated)},
        {"last_observed", optionalTimestampJson(view.device.lastObserved)},
        {"online", view.online}
    };
}

inline void to_json(nlohmann::json &j, const DeviceSummary &summary)
{
    j = nlohmann::json{
        {"hardware_ethernet", summary.hardwareAddress},
        {"last_associated", optionalTimestampJson(summary.lastAssociated)},
        {"last_disassociated", optionalTimestampJson(summary.lastDisassociated)},
        {"last_observed", optionalTimestampJson(summary.lastObserved)}
    };
}

inline void to_json(nlohmann::json &j, const PresenceEvent &event)
{
    j = nlohmann::json{
        {"timestamp", toIso8601Utc(event.timestamp)},
        {"station", event.station},
        {"hardware_ethernet", event.hardwareAddress},
        {"action", event.action}
    };
}

inline void to_json(nlohmann::json &j, const StoreStatus &status)
{
    j = nlohmann::json{
        {"last_event_timestamp", optionalTimestampJson(status.lastEventTimestamp)},
        {"devices", status.deviceCount},
        {"online", status.onlineCount}
    };
}

} // namespace apwatch
