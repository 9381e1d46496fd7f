#include "daemon/line_ingestor.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/envelope_decoder.hpp"
#include "daemon/log_line_parser.hpp"

namespace apwatch {

LineIngestor::LineIngestor(PresenceStore &store, std::string apProgram)
    : m_store(store)
    , m_apProgram(std::move(apProgram))
{
}

IngestOutcome LineIngestor::ingest(const std::string &line)
{
    ++m_stats.lines;

    LineParseResult result;
    try {
        result = parseLogLine(line, m_apProgram);
    } catch (const DecodeError &ex) {
        ++m_stats.decodeFailures;
        APWLOG_DEBUG(QStringLiteral("LineIngestor"),
                     QStringLiteral("ingest"),
                     QStringLiteral("line_decode_failed"),
                     QString::fromUtf8(ex.what()),
                     QStringLiteral("json_envelope"),
                     logging::defaultWho(),
                     QString(),
                     (nlohmann::json{{"line", line}}));
        return IngestOutcome::DecodeFailed;
    }

    switch (result.status) {
    case LineStatus::NotApplicable:
        ++m_stats.notApplicable;
        return IngestOutcome::NotApplicable;
    case LineStatus::Ignored:
        ++m_stats.ignored;
        return IngestOutcome::Ignored;
    case LineStatus::GrammarError:
        ++m_stats.grammarFailures;
        APWLOG_ERROR(QStringLiteral("LineIngestor"),
                     QStringLiteral("ingest"),
                     QStringLiteral("message_parse_failed"),
                     QString::fromStdString(result.error),
                     QStringLiteral("station_grammar"),
                     logging::defaultWho(),
                     QString(),
                     (nlohmann::json{{"host", result.envelope.host},
                                     {"timestamp", toIso8601Utc(result.envelope.timestamp)},
                                     {"message", result.envelope.message}}));
        return IngestOutcome::GrammarFailed;
    case LineStatus::Event:
        break;
    }

    const PresenceEvent &event = *result.event;
    m_store.witness(event);
    ++m_stats.witnessed;

    APWLOG_INFO(QStringLiteral("LineIngestor"),
                QStringLiteral("ingest"),
                QStringLiteral("station_") + QString::fromStdString(toActionString(event.action)),
                QStringLiteral("hostapd_event"),
                QStringLiteral("witness"),
                logging::defaultWho(),
                QString(),
                nlohmann::json(event));
    return IngestOutcome::Witnessed;
}

} // namespace apwatch
