#include "output/uploaders.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <glog/logging.h>

#include "output/snapshot.h"

namespace fs = std::filesystem;

namespace Collector {

bool LocalDirUploader::UploadAndSendLogs(const Server& server, const Grant& grant,
		const CollectionOpts& opts, const LogState& log_state, std::string& error) {
	try {
		fs::create_directories(grant.local_dir);
	} catch (const fs::filesystem_error& e) {
		error = std::string("Failed to create ") + grant.local_dir + ": " + e.what();
		return false;
	}

	collector_proto::LogSnapshot snapshot = BuildLogSnapshot(server, log_state);

	for (const auto& log_file : log_state.log_files) {
		std::string content;
		if (!log_file.tmp_file.ReadAll(content, error)) {
			return false;
		}

		fs::path content_path = fs::path(grant.local_dir) / (log_file.uuid + ".log");
		std::ofstream content_out(content_path, std::ios::binary | std::ios::trunc);
		if (!content_out.is_open()) {
			error = "Could not open " + content_path.string() + ": " + strerror(errno);
			return false;
		}
		content_out.write(content.data(), static_cast<std::streamsize>(content.size()));
		content_out.close();
		if (!content_out) {
			error = "Could not write " + content_path.string();
			return false;
		}

		fs::path snapshot_path = fs::path(grant.local_dir) / (log_file.uuid + ".snapshot");
		std::ofstream snapshot_out(snapshot_path, std::ios::binary | std::ios::trunc);
		if (!snapshot_out.is_open() || !snapshot.SerializeToOstream(&snapshot_out)) {
			error = "Could not write " + snapshot_path.string();
			return false;
		}

		VLOG(1) << "[" << server.config.section_name << "] Wrote " << content.size()
		        << " bytes of logs to " << content_path.string();
	}
	return true;
}

collector_proto::CollectorApi::StubInterface* GrpcLogUploader::StubFor(const std::string& target) {
	auto it = stubs_.find(target);
	if (it == stubs_.end()) {
		auto stub = collector_proto::CollectorApi::NewStub(
				grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));
		it = stubs_.emplace(target, std::move(stub)).first;
	}
	return it->second.get();
}

bool GrpcLogUploader::UploadAndSendLogs(const Server& server, const Grant& grant,
		const CollectionOpts& opts, const LogState& log_state, std::string& error) {
	if (grant.s3_url.empty()) {
		error = "Grant has no upload target";
		return false;
	}

	collector_proto::LogSnapshot snapshot = BuildLogSnapshot(server, log_state);
	auto* stub = StubFor(grant.s3_url);

	for (const auto& log_file : log_state.log_files) {
		collector_proto::UploadLogsRequest request;
		request.set_api_key(server.config.api_key);
		request.mutable_upload_fields()->insert(grant.s3_fields.begin(), grant.s3_fields.end());
		request.set_log_file_uuid(log_file.uuid);
		if (!log_file.tmp_file.ReadAll(*request.mutable_content(), error)) {
			return false;
		}
		*request.mutable_snapshot() = snapshot;

		collector_proto::UploadLogsResponse response;
		grpc::ClientContext context;
		context.set_deadline(std::chrono::system_clock::now() + timeout_);

		grpc::Status status = stub->UploadLogs(&context, request, &response);
		if (!status.ok()) {
			error = "UploadLogs failed (" + std::to_string(status.error_code()) + "): " +
				status.error_message();
			return false;
		}
		if (!response.success()) {
			error = "UploadLogs rejected: " + response.message();
			return false;
		}

		VLOG(1) << "[" << server.config.section_name << "] Uploaded log file " << log_file.uuid
		        << " (" << request.content().size() << " bytes)";
	}
	return true;
}

bool GrantUploader::UploadAndSendLogs(const Server& server, const Grant& grant,
		const CollectionOpts& opts, const LogState& log_state, std::string& error) {
	if (!opts.submit_collected_data) {
		LOG(INFO) << "[" << server.config.section_name << "] Skipping log upload, "
		          << "submission of collected data is disabled";
		return true;
	}
	if (grant.HasLocalDir()) {
		return local_->UploadAndSendLogs(server, grant, opts, log_state, error);
	}
	return remote_->UploadAndSendLogs(server, grant, opts, log_state, error);
}

} // namespace Collector
