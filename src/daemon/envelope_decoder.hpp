#pragma once

#include <stdexcept>
#include <string>

#include "common/models.hpp"

namespace apwatch {

// Raised for a line that is not a usable syslog-ng JSON record.
// Only that line is lost; callers log and continue.
class DecodeError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Decode one line written by the syslog-ng template
 *   $(format-json host=$HOST program=$PROGRAM timestamp=$ISODATE message=$MESSAGE)
 *
 * host, program and message must be strings; timestamp must be an RFC3339
 * string. Additional keys are ignored. Throws DecodeError otherwise.
 */
LogEnvelope decodeEnvelope(const std::string &line);

} // namespace apwatch
