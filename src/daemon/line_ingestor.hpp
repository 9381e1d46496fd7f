#pragma once

#include <cstdint>
#include <string>

#include "daemon/presence_store.hpp"

namespace apwatch {

enum class IngestOutcome {
    Witnessed,
    NotApplicable,
    Ignored,
    DecodeFailed,
    GrammarFailed
};

struct IngestStats {
    std::uint64_t lines = 0;
    std::uint64_t witnessed = 0;
    std::uint64_t notApplicable = 0;
    std::uint64_t ignored = 0;
    std::uint64_t decodeFailures = 0;
    std::uint64_t grammarFailures = 0;
};

// LineIngestor is the single writer of a PresenceStore: it turns raw log lines
// into events and witnesses them in the order received. Bad lines are logged
// and dropped; nothing here is fatal.
class LineIngestor {
public:
    LineIngestor(PresenceStore &store, std::string apProgram);

    IngestOutcome ingest(const std::string &line);

    const IngestStats &stats() const
    {
        return m_stats;
    }

private:
    PresenceStore &m_store;
    std::string m_apProgram;
    IngestStats m_stats;
};

} // namespace apwatch
