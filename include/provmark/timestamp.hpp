#ifndef PROVMARK_TIMESTAMP_HPP
#define PROVMARK_TIMESTAMP_HPP

#include <cstdint>
#include <string>

namespace ProvMark {
namespace Timestamp {

    // Milliseconds since the Unix epoch, UTC.
    int64_t now_unix_millis();

    // Current time as YYYY-MM-DDTHH:MM:SS.mmmZ.
    std::string now_iso8601();

    std::string format_iso8601(int64_t unix_millis);

    /**
     * @brief Parses YYYY-MM-DDTHH:MM:SS[.fff]Z into Unix milliseconds.
     *
     * Fractions longer than three digits are truncated to milliseconds.
     * @throws ProvMark::MalformedInput for any other shape.
     */
    int64_t parse_iso8601_millis(const std::string& text);

} // namespace Timestamp
} // namespace ProvMark

#endif // PROVMARK_TIMESTAMP_HPP
