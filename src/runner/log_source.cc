#include "runner/log_source.h"

#include <filesystem>
#include <system_error>

#include <glog/logging.h>
#include "absl/strings/numbers.h"
#include "absl/strings/string_view.h"

namespace fs = std::filesystem;

namespace Collector {

namespace {

// The "[%p]" of a log_line_prefix sits near the start of the line
constexpr size_t kMaxPrefixLength = 256;
constexpr size_t kMaxPidDigits = 10;

bool IsDigit(char c) {
	return c >= '0' && c <= '9';
}

bool IsUpper(char c) {
	return c >= 'A' && c <= 'Z';
}

bool IsSpace(char c) {
	return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

// Matches "[<pid>]<non-space>* <LEVEL>:<whitespace>+" at the '[' in raw[open].
// On success content_start points past the whitespace.
bool MatchPrefixAt(absl::string_view raw, size_t open, int32_t& pid, absl::string_view& level,
                   size_t& content_start) {
	size_t pos = open + 1;
	size_t digits_begin = pos;
	while (pos < raw.size() && IsDigit(raw[pos])) ++pos;
	size_t digits = pos - digits_begin;
	if (digits == 0 || digits > kMaxPidDigits) return false;
	if (pos >= raw.size() || raw[pos] != ']') return false;
	if (!absl::SimpleAtoi(raw.substr(digits_begin, digits), &pid) || pid <= 0) return false;
	++pos;

	while (pos < raw.size() && !IsSpace(raw[pos])) ++pos;
	if (pos >= raw.size() || raw[pos] != ' ') return false;
	++pos;

	size_t level_begin = pos;
	while (pos < raw.size() && IsUpper(raw[pos])) ++pos;
	if (pos == level_begin) return false;
	if (pos < raw.size() && IsDigit(raw[pos])) ++pos;
	if (pos >= raw.size() || raw[pos] != ':') return false;
	level = raw.substr(level_begin, pos - level_begin);
	++pos;

	if (pos >= raw.size() || !IsSpace(raw[pos])) return false;
	while (pos < raw.size() && IsSpace(raw[pos])) ++pos;
	content_start = pos;
	return true;
}

} // namespace

LogLine ParseLogLine(const std::string& raw, Clock::time_point collected_at) {
	LogLine log_line;
	log_line.collected_at = collected_at;

	// <anything> [<pid>]<anything> <LEVEL>:  <message>
	absl::string_view view = raw;
	absl::string_view head = view.substr(0, kMaxPrefixLength);
	for (size_t open = head.find('['); open != absl::string_view::npos; open = head.find('[', open + 1)) {
		int32_t pid = 0;
		absl::string_view level;
		size_t content_start = 0;
		if (MatchPrefixAt(view, open, pid, level, content_start)) {
			log_line.backend_pid = pid;
			log_line.log_level = ParseLogLevel(std::string(level));
			log_line.content = raw.substr(content_start);
			return log_line;
		}
	}

	// Continuation output is indented with a tab
	size_t begin = raw.find_first_not_of('\t');
	log_line.content = (begin == std::string::npos) ? std::string() : raw.substr(begin);
	return log_line;
}

FileLogSource::FileLogSource(std::string path, bool from_start)
	: path_(std::move(path)) {
	if (!Open(from_start)) {
		LOG(WARNING) << "[FileLogSource] Cannot open " << path_ << " yet, will retry";
	}
}

bool FileLogSource::Open(bool from_start) {
	in_.close();
	in_.clear();
	in_.open(path_, std::ios::in | std::ios::binary);
	if (!in_.is_open()) {
		return false;
	}
	offset_ = 0;
	if (!from_start) {
		in_.seekg(0, std::ios::end);
		offset_ = in_.tellg();
	}
	return true;
}

std::vector<LogLine> FileLogSource::Poll() {
	std::vector<LogLine> log_lines;

	if (!in_.is_open() && !Open(true)) {
		LOG_EVERY_N(WARNING, 60) << "[FileLogSource] Cannot open " << path_;
		return log_lines;
	}

	std::error_code ec;
	auto size = fs::file_size(path_, ec);
	if (!ec && static_cast<std::streamoff>(size) < offset_) {
		LOG(INFO) << "[FileLogSource] " << path_ << " was truncated, reading from the start";
		partial_.clear();
		if (!Open(true)) {
			return log_lines;
		}
	}

	in_.clear();
	in_.seekg(offset_);

	const Clock::time_point now = Clock::now();
	std::string line;
	while (std::getline(in_, line)) {
		offset_ += static_cast<std::streamoff>(line.size());
		if (in_.eof()) {
			// No newline yet, wait for the rest
			partial_ += line;
			break;
		}
		offset_ += 1;

		line = partial_ + line;
		partial_.clear();
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		if (line.empty()) {
			continue;
		}
		log_lines.push_back(ParseLogLine(line, now));
	}
	in_.clear();

	VLOG_IF(3, !log_lines.empty()) << "[FileLogSource] Read " << log_lines.size() << " lines from " << path_;
	return log_lines;
}

} // namespace Collector
