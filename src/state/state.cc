#include "state/state.h"

#include <cstdio>
#include <random>

namespace Collector {

namespace {

struct LevelName {
	LogLevel level;
	const char* name;
};

constexpr LevelName kLevelNames[] = {
	{LogLevel::UNKNOWN, "UNKNOWN"},
	{LogLevel::DEBUG, "DEBUG"},
	{LogLevel::INFO, "INFO"},
	{LogLevel::NOTICE, "NOTICE"},
	{LogLevel::WARNING, "WARNING"},
	{LogLevel::ERROR, "ERROR"},
	{LogLevel::LOG, "LOG"},
	{LogLevel::FATAL, "FATAL"},
	{LogLevel::PANIC, "PANIC"},
	{LogLevel::DETAIL, "DETAIL"},
	{LogLevel::HINT, "HINT"},
	{LogLevel::CONTEXT, "CONTEXT"},
	{LogLevel::STATEMENT, "STATEMENT"},
	{LogLevel::QUERY, "QUERY"},
};

} // namespace

const char* LogLevelName(LogLevel level) {
	for (const auto& entry : kLevelNames) {
		if (entry.level == level) return entry.name;
	}
	return "UNKNOWN";
}

LogLevel ParseLogLevel(const std::string& name) {
	// DEBUG1..DEBUG5 all map to DEBUG
	if (name.compare(0, 5, "DEBUG") == 0) return LogLevel::DEBUG;
	for (const auto& entry : kLevelNames) {
		if (name == entry.name) return entry.level;
	}
	return LogLevel::UNKNOWN;
}

const char* LogClassificationName(LogClassification classification) {
	switch (classification) {
		case LogClassification::UNKNOWN: return "UNKNOWN";
		case LogClassification::COLLECTOR_IDENTIFY: return "COLLECTOR_IDENTIFY";
		case LogClassification::STATEMENT_DURATION: return "STATEMENT_DURATION";
		case LogClassification::STATEMENT_LOG: return "STATEMENT_LOG";
	}
	return "UNKNOWN";
}

bool operator==(const LogLine& a, const LogLine& b) {
	return a.content == b.content &&
	       a.log_level == b.log_level &&
	       a.backend_pid == b.backend_pid &&
	       a.collected_at == b.collected_at &&
	       a.byte_start == b.byte_start &&
	       a.byte_content_start == b.byte_content_start &&
	       a.byte_end == b.byte_end &&
	       a.classification == b.classification &&
	       a.details == b.details;
}

void LogState::Cleanup() {
	for (auto& log_file : log_files) {
		log_file.Cleanup();
	}
}

std::string GenerateUuid() {
	static thread_local std::mt19937_64 gen(std::random_device{}());
	uint64_t hi = gen();
	uint64_t lo = gen();

	// Version 4, variant 10xx
	hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
	lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

	char buf[37];
	std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
			static_cast<unsigned>(hi >> 32),
			static_cast<unsigned>((hi >> 16) & 0xFFFF),
			static_cast<unsigned>(hi & 0xFFFF),
			static_cast<unsigned>(lo >> 48),
			static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
	return buf;
}

} // namespace Collector
