#include "runner/log_runner.h"

#include <iterator>
#include <thread>

#include <glog/logging.h>

namespace Collector {

DispatchOutcome LogRunner::Tick() {
	std::vector<LogLine> new_lines = source_.Poll();
	backlog_.insert(backlog_.end(),
			std::make_move_iterator(new_lines.begin()), std::make_move_iterator(new_lines.end()));

	// Full snapshots update the shared context on their own schedule, the
	// pipeline works on a copy taken under the caller-owned lock
	Server server;
	{
		absl::MutexLock lock(server_.state_mutex.get());
		server.config = server_.config;
		server.grant = server_.grant;
	}
	server.state_mutex = server_.state_mutex;
	section_name_ = server.config.section_name;

	backlog_ = dispatcher_.AnalyzeInGroupsAndSend(server, backlog_, opts_);

	DispatchOutcome outcome = dispatcher_.last_outcome();
	VLOG(2) << "[" << server.config.section_name << "] Tick " << DispatchOutcomeName(outcome)
	        << ", backlog " << backlog_.size() << " lines";
	if (outcome == DispatchOutcome::kGrantFailed || outcome == DispatchOutcome::kUploadFailed ||
			outcome == DispatchOutcome::kTmpFileFailed) {
		LOG_EVERY_N(WARNING, 10) << "[" << server.config.section_name << "] Logs are being retried, "
		                         << backlog_.size() << " lines waiting";
	}
	return outcome;
}

void LogRunner::Run(const std::atomic<bool>& stop) {
	while (!stop.load(std::memory_order_relaxed)) {
		Tick();
		std::this_thread::sleep_for(poll_interval_);
	}
	if (!backlog_.empty()) {
		LOG(WARNING) << "[" << section_name_ << "] Stopping with "
		             << backlog_.size() << " undelivered log lines";
	}
}

bool LogRunner::RunTest(TestSucceededSignal& signal, std::chrono::milliseconds timeout) {
	const auto deadline = std::chrono::steady_clock::now() + timeout;
	while (std::chrono::steady_clock::now() < deadline) {
		Tick();
		if (signal.WaitFor(poll_interval_)) {
			return true;
		}
	}
	return false;
}

} // namespace Collector
