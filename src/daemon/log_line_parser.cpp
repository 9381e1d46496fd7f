#include "daemon/log_line_parser.hpp"

#include <utility>

#include "daemon/envelope_decoder.hpp"
#include "daemon/message_grammar.hpp"

namespace apwatch {

LineParseResult parseLogLine(const std::string &line, const std::string &apProgram)
{
    LineParseResult result;
    result.envelope = decodeEnvelope(line);

    if (result.envelope.program != apProgram) {
        result.status = LineStatus::NotApplicable;
        return result;
    }

    GrammarResult grammar = parseStationMessage(result.envelope.message);
    switch (grammar.status) {
    case GrammarStatus::NoEvent:
        result.status = LineStatus::Ignored;
        return result;
    case GrammarStatus::Error:
        result.status = LineStatus::GrammarError;
        result.error = std::move(grammar.error);
        return result;
    case GrammarStatus::Event:
        break;
    }

    PresenceEvent event;
    event.timestamp = result.envelope.timestamp;
    event.station = Station{result.envelope.host, std::move(grammar.interfaceName)};
    event.hardwareAddress = std::move(grammar.hardwareAddress);
    event.action = grammar.action;

    result.status = LineStatus::Event;
    result.event = std::move(event);
    return result;
}

} // namespace apwatch
