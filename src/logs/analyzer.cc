#include "logs/analyzer.h"

#include <cmath>

#include <glog/logging.h>
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/string_view.h"

namespace Collector {

namespace {

constexpr absl::string_view kStatementPrefix = "statement: ";
constexpr absl::string_view kDurationPrefix = "duration: ";
constexpr absl::string_view kExecutePrefix = "execute ";
constexpr absl::string_view kDurationUnit = " ms";
constexpr absl::string_view kWhitespace = " \t\r\n";

// Longer numbers are not durations Postgres prints
constexpr size_t kMaxDurationDigits = 32;

std::string Trim(absl::string_view s) {
	size_t begin = s.find_first_not_of(kWhitespace);
	if (begin == absl::string_view::npos) return "";
	size_t end = s.find_last_not_of(kWhitespace);
	return std::string(s.substr(begin, end - begin + 1));
}

bool IsDigit(char c) {
	return c >= '0' && c <= '9';
}

size_t SkipDigits(absl::string_view s, size_t pos) {
	while (pos < s.size() && IsDigit(s[pos])) ++pos;
	return pos;
}

// Section name following the marker, up to a closing quote or the end of line
bool ExtractIdentifySection(absl::string_view content, std::string& section) {
	size_t pos = content.find(kCollectorIdentifyMarker);
	if (pos == absl::string_view::npos) return false;

	absl::string_view rest = content.substr(pos + std::char_traits<char>::length(kCollectorIdentifyMarker));
	size_t quote = rest.find_first_of("'\"");
	if (quote != absl::string_view::npos) {
		rest = rest.substr(0, quote);
	}
	section = Trim(rest);
	return !section.empty();
}

// "duration: <ms> ms" optionally followed by "statement: <query>" or
// "execute <name>: <query>". has_query is false for a bare duration.
bool ParseDuration(absl::string_view content, std::string& duration, double& runtime_ms,
                   bool& has_query, absl::string_view& query) {
	if (!absl::StartsWith(content, kDurationPrefix)) return false;
	absl::string_view rest = content.substr(kDurationPrefix.size());

	size_t end = SkipDigits(rest, 0);
	if (end == 0) return false;
	if (end < rest.size() && rest[end] == '.') {
		size_t fraction_end = SkipDigits(rest, end + 1);
		if (fraction_end == end + 1) return false;
		end = fraction_end;
	}
	if (end > kMaxDurationDigits) return false;

	absl::string_view number = rest.substr(0, end);
	if (!absl::SimpleAtod(number, &runtime_ms) || !std::isfinite(runtime_ms)) return false;
	rest = rest.substr(end);
	if (!absl::StartsWith(rest, kDurationUnit)) return false;
	rest = rest.substr(kDurationUnit.size());

	has_query = false;
	if (rest.empty()) {
		duration = std::string(number);
		return true;
	}

	size_t text = rest.find_first_not_of(kWhitespace);
	if (text == 0 || text == absl::string_view::npos) return false;
	rest = rest.substr(text);

	if (absl::StartsWith(rest, kStatementPrefix)) {
		query = rest.substr(kStatementPrefix.size());
	} else if (absl::StartsWith(rest, kExecutePrefix)) {
		size_t colon = rest.find(':');
		if (colon == absl::string_view::npos || colon + 1 >= rest.size() || rest[colon + 1] != ' ') {
			return false;
		}
		query = rest.substr(colon + 2);
	} else {
		return false;
	}
	duration = std::string(number);
	has_query = true;
	return true;
}

} // namespace

AnalyzeResult PostgresLogAnalyzer::AnalyzeBackendLogLines(const std::vector<LogLine>& log_lines) {
	AnalyzeResult result;
	result.log_lines.reserve(log_lines.size());

	for (const auto& in : log_lines) {
		LogLine log_line = in;
		absl::string_view content = log_line.content;
		std::string section;
		std::string duration;
		double runtime_ms = 0;
		bool has_query = false;
		absl::string_view query;

		if (ExtractIdentifySection(content, section)) {
			log_line.classification = LogClassification::COLLECTOR_IDENTIFY;
			log_line.details[kDetailConfigSection] = section;
		} else if (ParseDuration(content, duration, runtime_ms, has_query, query)) {
			log_line.classification = LogClassification::STATEMENT_DURATION;
			log_line.details["duration_ms"] = duration;
			if (has_query) {
				QuerySample sample;
				sample.occurred_at = log_line.collected_at;
				sample.runtime_ms = runtime_ms;
				sample.query = Trim(query);
				result.query_samples.push_back(std::move(sample));
			}
		} else if (absl::StartsWith(content, kStatementPrefix)) {
			log_line.classification = LogClassification::STATEMENT_LOG;
			log_line.details["query"] = Trim(content.substr(kStatementPrefix.size()));
		}

		result.log_lines.push_back(std::move(log_line));
	}

	VLOG(3) << "[PostgresLogAnalyzer] " << result.log_lines.size() << " lines, "
	        << result.query_samples.size() << " samples";
	return result;
}

} // namespace Collector
