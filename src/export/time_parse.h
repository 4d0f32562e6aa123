#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace Stabping {

/**
 * Parses "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DD HH:MM" or "YYYY-MM-DD" as UTC.
 * The whole string must match one of the forms.
 * @return Seconds since the Unix epoch, or nullopt if the text is not a valid datetime
 */
std::optional<int64_t> ParseUtcDatetime(const std::string& text);

} // namespace Stabping
