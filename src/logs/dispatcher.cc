#include "logs/dispatcher.h"

#include <glog/logging.h>

#include "common/cleanup_guard.h"
#include "logs/backend_joiner.h"
#include "logs/debug_print.h"
#include "logs/stitcher.h"

namespace Collector {

const char* DispatchOutcomeName(DispatchOutcome outcome) {
	switch (outcome) {
		case DispatchOutcome::kNothingReady: return "NothingReady";
		case DispatchOutcome::kTmpFileFailed: return "TmpFileFailed";
		case DispatchOutcome::kNothingToSend: return "NothingToSend";
		case DispatchOutcome::kDebugPrinted: return "DebugPrinted";
		case DispatchOutcome::kTestRun: return "TestRun";
		case DispatchOutcome::kGrantFailed: return "GrantFailed";
		case DispatchOutcome::kGrantDenied: return "GrantDenied";
		case DispatchOutcome::kUploadFailed: return "UploadFailed";
		case DispatchOutcome::kSent: return "Sent";
	}
	return "Unknown";
}

std::vector<LogLine> LogDispatcher::AnalyzeInGroupsAndSend(const Server& server,
		const std::vector<LogLine>& log_lines, const CollectionOpts& opts) {
	return AnalyzeInGroupsAndSend(server, log_lines, opts, Clock::now());
}

std::vector<LogLine> LogDispatcher::AnalyzeInGroupsAndSend(const Server& server,
		const std::vector<LogLine>& log_lines, const CollectionOpts& opts,
		Clock::time_point now) {
	const std::string prefix = "[" + server.config.section_name + "] ";
	last_error_ = ERR_NO_ERROR;

	// Lines missing both level and pid are continuation text from the logging
	// collector's file output, fold them in before any time or pid based logic
	std::vector<LogLine> stitched = StitchLogLines(log_lines);
	ReadinessSplit split = SplitByReadiness(stitched, now, readiness_window_);

	if (split.ready.empty()) {
		last_outcome_ = DispatchOutcome::kNothingReady;
		return std::move(split.too_fresh);
	}

	LogState log_state;
	log_state.collected_at = now;
	// Every return below releases the tmp file
	CleanupGuard cleanup([&log_state]() { log_state.Cleanup(); });

	LogFile& log_file = log_state.log_files.emplace_back();
	log_file.uuid = GenerateUuid();

	std::string error;
	if (!log_file.tmp_file.Create(server.config.tmp_dir, error)) {
		LOG(ERROR) << prefix << "Could not allocate tempfile for logs: " << error;
		last_outcome_ = DispatchOutcome::kTmpFileFailed;
		last_error_ = ERR_RESOURCE_ALLOCATION;
		return log_lines;
	}

	PackageResult packaged = writer_factory_
			? PackageLogLines(split.ready, writer_factory_(log_file.tmp_file))
			: PackageLogLines(split.ready, log_file.tmp_file);
	if (packaged.error != ERR_NO_ERROR) {
		// Degraded, the lines written so far still go out
		last_error_ = packaged.error;
	}

	// Continuations are only meaningful within one backend's own lines
	BackendLogLines backend_log_lines = GroupByBackend(split.ready);
	for (const auto& [pid, backend_lines] : backend_log_lines) {
		std::vector<LogLine> analyzable = JoinContinuationLines(backend_lines);
		AnalyzeResult analyzed = analyzer_.AnalyzeBackendLogLines(analyzable);

		for (auto& log_line : analyzed.log_lines) {
			log_file.log_lines.push_back(std::move(log_line));
		}
		for (auto& sample : analyzed.query_samples) {
			log_state.query_samples.push_back(std::move(sample));
		}
	}

	VLOG(2) << prefix << split.ready.size() << " ready lines (" << packaged.bytes_written
	        << " bytes, " << backend_log_lines.size() << " backends), "
	        << split.too_fresh.size() << " too fresh";

	// Nothing to send, so skip getting the grant and other work
	if (log_file.log_lines.empty() && log_state.query_samples.empty()) {
		last_outcome_ = DispatchOutcome::kNothingToSend;
		return std::move(split.too_fresh);
	}

	if (opts.debug_logs) {
		LOG(INFO) << prefix << "Would have sent log state:";
		std::string content;
		if (!log_file.tmp_file.ReadAll(content, error)) {
			LOG(ERROR) << prefix << "Could not read back log content: " << error;
		}
		PrintDebugInfo(content, log_file.log_lines, log_state.query_samples, debug_out_);
		last_outcome_ = DispatchOutcome::kDebugPrinted;
		return std::move(split.too_fresh);
	}

	if (opts.test_run) {
		for (const auto& log_line : log_file.log_lines) {
			if (log_line.classification != LogClassification::COLLECTOR_IDENTIFY) continue;
			auto it = log_line.details.find(kDetailConfigSection);
			if (it == log_line.details.end() || it->second != server.config.section_name) continue;

			LOG(INFO) << prefix << "Found collector identify marker in logs";
			if (test_signal_ != nullptr && !test_signal_->Notify()) {
				VLOG(1) << prefix << "Test success already signalled";
			}
			break;
		}
		last_outcome_ = DispatchOutcome::kTestRun;
		return std::move(split.too_fresh);
	}

	Grant grant;
	if (!grant_client_.GetLogsGrant(server, opts, grant, error)) {
		LOG(ERROR) << prefix << "Could not get log grant: " << error;
		last_outcome_ = DispatchOutcome::kGrantFailed;
		last_error_ = ERR_AUTHORIZATION_REQUEST;
		return log_lines;  // Retry
	}

	if (!grant.valid) {
		VLOG(1) << prefix << "Log collection disabled from server, skipping";
		last_outcome_ = DispatchOutcome::kGrantDenied;
		last_error_ = ERR_AUTHORIZATION_DENIED;
		return std::move(split.too_fresh);
	}

	if (!uploader_.UploadAndSendLogs(server, grant, opts, log_state, error)) {
		LOG(ERROR) << prefix << "Failed to upload/send logs: " << error;
		last_outcome_ = DispatchOutcome::kUploadFailed;
		last_error_ = ERR_UPLOAD;
		return log_lines;  // Retry
	}

	last_outcome_ = DispatchOutcome::kSent;
	return std::move(split.too_fresh);
}

} // namespace Collector
