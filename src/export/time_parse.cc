#include "time_parse.h"

#include <cctype>
#include <ctime>

namespace Stabping {

namespace {

constexpr const char* kDatetimeFormats[] = {
	"%Y-%m-%d %H:%M:%S",
	"%Y-%m-%d %H:%M",
	"%Y-%m-%d",
};

} // namespace

std::optional<int64_t> ParseUtcDatetime(const std::string& text) {
	// strptime skips leading whitespace and takes short years; require "YYYY-".
	if (text.size() < 5 || text[4] != '-') {
		return std::nullopt;
	}
	for (size_t i = 0; i < 4; ++i) {
		if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
			return std::nullopt;
		}
	}
	for (const char* format : kDatetimeFormats) {
		std::tm tm{};
		const char* end = strptime(text.c_str(), format, &tm);
		if (end == nullptr || *end != '\0') {
			continue;
		}
		// strptime range-checks each field but not the day against its month.
		const int day = tm.tm_mday;
		const int month = tm.tm_mon;
		const std::time_t ts = timegm(&tm);
		if (tm.tm_mday != day || tm.tm_mon != month) {
			return std::nullopt;
		}
		return static_cast<int64_t>(ts);
	}
	return std::nullopt;
}

} // namespace Stabping
