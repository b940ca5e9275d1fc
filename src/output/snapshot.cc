#include "output/snapshot.h"

namespace Collector {

int64_t ToUnixMillis(Clock::time_point t) {
	return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

collector_proto::LogSnapshot BuildLogSnapshot(const Server& server, const LogState& log_state) {
	collector_proto::LogSnapshot snapshot;
	snapshot.set_collected_at_ms(ToUnixMillis(log_state.collected_at));
	snapshot.set_section_name(server.config.section_name);

	for (size_t idx = 0; idx < log_state.log_files.size(); ++idx) {
		const LogFile& log_file = log_state.log_files[idx];

		auto* ref = snapshot.add_log_file_references();
		ref->set_uuid(log_file.uuid);
		ref->set_byte_size(log_file.tmp_file.size());

		for (const auto& log_line : log_file.log_lines) {
			auto* info = snapshot.add_log_line_informations();
			info->set_log_file_idx(static_cast<int32_t>(idx));
			info->set_byte_start(log_line.byte_start);
			info->set_byte_content_start(log_line.byte_content_start);
			info->set_byte_end(log_line.byte_end);
			info->set_occurred_at_ms(ToUnixMillis(log_line.collected_at));
			info->set_backend_pid(log_line.backend_pid);
			// Enum values line up one to one
			info->set_level(static_cast<collector_proto::LogLevel>(log_line.log_level));
			info->set_classification(
					static_cast<collector_proto::LogClassification>(log_line.classification));
			info->mutable_details()->insert(log_line.details.begin(), log_line.details.end());
		}
	}

	for (const auto& sample : log_state.query_samples) {
		auto* out = snapshot.add_query_samples();
		out->set_occurred_at_ms(ToUnixMillis(sample.occurred_at));
		out->set_runtime_ms(sample.runtime_ms);
		out->set_query(sample.query);
		for (const auto& param : sample.parameters) {
			out->add_parameters(param);
		}
		out->set_database(sample.database);
		out->set_username(sample.username);
		out->set_application(sample.application);
	}

	return snapshot;
}

} // namespace Collector
