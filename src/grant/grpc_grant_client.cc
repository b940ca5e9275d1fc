#include "grant/grpc_grant_client.h"

#include <glog/logging.h>

namespace Collector {

void GrantFromProto(const collector_proto::GrantResponse& response, Grant& grant) {
	grant = Grant{};
	grant.valid = response.valid();
	grant.config.server_id = response.config().server_id();
	grant.config.sentry_dsn = response.config().sentry_dsn();

	const auto& features = response.config().features();
	grant.config.features.logs = features.logs();
	grant.config.features.explain = features.explain();
	grant.config.features.statement_reset_frequency = features.statement_reset_frequency();
	// Zero means "not set", keep the 30s default
	if (features.statement_timeout_ms() > 0) {
		grant.config.features.statement_timeout_ms = features.statement_timeout_ms();
	}

	grant.s3_url = response.s3_url();
	for (const auto& field : response.s3_fields()) {
		grant.s3_fields[field.first] = field.second;
	}
	grant.local_dir = response.local_dir();
}

bool GrpcGrantClient::GetLogsGrant(const Server& server, const CollectionOpts& opts,
		Grant& grant, std::string& error) {
	if (opts.force_empty_grant) {
		grant = EmptyGrant();
		return true;
	}

	collector_proto::GrantRequest request;
	request.set_api_key(server.config.api_key);
	request.set_system_id(server.config.system_id);
	request.set_section_name(server.config.section_name);
	request.set_application_name(opts.collector_application_name);

	collector_proto::GrantResponse response;
	grpc::ClientContext context;
	context.set_deadline(std::chrono::system_clock::now() + timeout_);

	grpc::Status status = stub_->GetLogsGrant(&context, request, &response);
	if (!status.ok()) {
		error = "GetLogsGrant failed (" + std::to_string(status.error_code()) + "): " +
			status.error_message();
		return false;
	}

	GrantFromProto(response, grant);
	VLOG(2) << "[" << server.config.section_name << "] Log grant valid=" << grant.valid
	        << " local_dir=" << grant.local_dir << " s3_url=" << grant.s3_url;
	return true;
}

} // namespace Collector
