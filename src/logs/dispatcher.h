#ifndef COLLECTOR_LOGS_DISPATCHER_H_
#define COLLECTOR_LOGS_DISPATCHER_H_

#include <chrono>
#include <functional>
#include <iostream>
#include <vector>

#include "common/errors.h"
#include "grant/grant_client.h"
#include "logs/analyzer.h"
#include "logs/packager.h"
#include "logs/readiness.h"
#include "logs/test_signal.h"
#include "output/log_uploader.h"
#include "state/state.h"

namespace Collector {

/**
 * Terminal state of one dispatch tick
 */
enum class DispatchOutcome {
	kNothingReady,    // all lines too fresh, no work done
	kTmpFileFailed,   // full retry
	kNothingToSend,   // analyzer produced nothing, ready lines dropped
	kDebugPrinted,    // printed only, ready lines dropped
	kTestRun,         // identify marker scan only, ready lines dropped
	kGrantFailed,     // full retry
	kGrantDenied,     // server-side opt-out, ready lines dropped
	kUploadFailed,    // full retry
	kSent,
};

const char* DispatchOutcomeName(DispatchOutcome outcome);

// Builds the write function that packages a tick's ready lines into its tmp file
using TmpFileWriterFactory = std::function<LogWriteFn(ScopedTmpFile& tmp_file)>;

/**
 * Log ingestion and dispatch pipeline.
 *
 * Each call stitches fragments, holds back lines younger than the readiness
 * window, packages the ready lines into a fresh tmp file, joins continuations
 * per backend, runs the analyzer and then either prints, scans (test run) or
 * uploads under a fresh grant. The returned lines are the backlog to pass in
 * again, together with new lines, on the next tick:
 *  - the too-fresh lines, after any intentional drop or a successful upload
 *  - the complete, unmodified input, after tmp file, grant or upload failures
 *
 * Not reentrant; the tmp file never outlives the call.
 */
class LogDispatcher {
public:
	LogDispatcher(IGrantClient& grant_client, ILogUploader& uploader, ILogAnalyzer& analyzer,
			TestSucceededSignal* test_signal = nullptr,
			std::chrono::milliseconds readiness_window = kDefaultReadinessWindow,
			std::ostream& debug_out = std::cout)
		: grant_client_(grant_client),
		  uploader_(uploader),
		  analyzer_(analyzer),
		  test_signal_(test_signal),
		  readiness_window_(readiness_window),
		  debug_out_(debug_out) {}

	std::vector<LogLine> AnalyzeInGroupsAndSend(const Server& server,
			const std::vector<LogLine>& log_lines, const CollectionOpts& opts);

	// Same, with the tick's clock reading supplied by the caller
	std::vector<LogLine> AnalyzeInGroupsAndSend(const Server& server,
			const std::vector<LogLine>& log_lines, const CollectionOpts& opts,
			Clock::time_point now);

	// Replaces the plain tmp file append, e.g. to fail writes part way through
	void set_writer_factory(TmpFileWriterFactory factory) { writer_factory_ = std::move(factory); }

	DispatchOutcome last_outcome() const { return last_outcome_; }
	CollectorError last_error() const { return last_error_; }

private:
	IGrantClient& grant_client_;
	ILogUploader& uploader_;
	ILogAnalyzer& analyzer_;
	TestSucceededSignal* test_signal_;
	std::chrono::milliseconds readiness_window_;
	std::ostream& debug_out_;
	TmpFileWriterFactory writer_factory_;

	DispatchOutcome last_outcome_ = DispatchOutcome::kNothingReady;
	CollectorError last_error_ = ERR_NO_ERROR;
};

} // namespace Collector

#endif // COLLECTOR_LOGS_DISPATCHER_H_
