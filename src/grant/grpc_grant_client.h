#ifndef COLLECTOR_GRANT_GRPC_GRANT_CLIENT_H_
#define COLLECTOR_GRANT_GRPC_GRANT_CLIENT_H_

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <collector.grpc.pb.h>

#include "grant/grant_client.h"

namespace Collector {

/**
 * Fetches grants from the control plane over gRPC.
 * force_empty_grant runs never touch the network.
 */
class GrpcGrantClient : public IGrantClient {
public:
	explicit GrpcGrantClient(std::shared_ptr<grpc::Channel> channel,
			std::chrono::milliseconds timeout = std::chrono::seconds(30))
		: stub_(collector_proto::CollectorApi::NewStub(channel)), timeout_(timeout) {}

	bool GetLogsGrant(const Server& server, const CollectionOpts& opts,
			Grant& grant, std::string& error) override;

private:
	std::unique_ptr<collector_proto::CollectorApi::StubInterface> stub_;
	std::chrono::milliseconds timeout_;
};

void GrantFromProto(const collector_proto::GrantResponse& response, Grant& grant);

} // namespace Collector

#endif // COLLECTOR_GRANT_GRPC_GRANT_CLIENT_H_
