#ifndef COLLECTOR_RUNNER_LOG_RUNNER_H_
#define COLLECTOR_RUNNER_LOG_RUNNER_H_

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

#include "logs/dispatcher.h"
#include "logs/test_signal.h"
#include "runner/log_source.h"
#include "state/state.h"

namespace Collector {

/**
 * Polling loop around the dispatcher: owns the backlog carried between ticks.
 */
class LogRunner {
public:
	LogRunner(Server& server, ILogSource& source, LogDispatcher& dispatcher,
			CollectionOpts opts, std::chrono::milliseconds poll_interval)
		: server_(server), source_(source), dispatcher_(dispatcher),
		  opts_(std::move(opts)), poll_interval_(poll_interval) {}

	/**
	 * One polling tick: new lines are appended to the backlog, the backlog is
	 * dispatched and replaced by what the dispatcher hands back.
	 * @return Outcome of the dispatch
	 */
	DispatchOutcome Tick();

	/**
	 * Ticks every poll interval until stop is set
	 */
	void Run(const std::atomic<bool>& stop);

	/**
	 * Ticks until the dispatcher signals that this server's identify marker was
	 * seen, or timeout expires
	 * @return true if the marker was found
	 */
	bool RunTest(TestSucceededSignal& signal, std::chrono::milliseconds timeout);

	size_t backlog_size() const { return backlog_.size(); }

private:
	Server& server_;
	ILogSource& source_;
	LogDispatcher& dispatcher_;
	const CollectionOpts opts_;
	const std::chrono::milliseconds poll_interval_;

	std::vector<LogLine> backlog_;
	// As of the last tick, taken under the state lock
	std::string section_name_;
};

} // namespace Collector

#endif // COLLECTOR_RUNNER_LOG_RUNNER_H_
