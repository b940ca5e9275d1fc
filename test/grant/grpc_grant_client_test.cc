#include <gtest/gtest.h>
#include "../../src/grant/grpc_grant_client.h"
#include "../fake_collector_api.h"

using namespace Collector;
using namespace Collector::test_util;
using namespace std::chrono_literals;

class GrpcGrantClientTest : public FakeCollectorApiTest {
protected:
    void SetUp() override {
        FakeCollectorApiTest::SetUp();
        server_config_.config.section_name = "db1";
        server_config_.config.api_key = "key-123";
        server_config_.config.system_id = "system-9";
        opts_.collector_application_name = "collector-test";
    }

    Server server_config_;
    CollectionOpts opts_;
};

TEST_F(GrpcGrantClientTest, ForceEmptyGrantSkipsNetwork) {
    // Nothing listens here, the call must not reach the channel
    GrpcGrantClient client(grpc::CreateChannel("127.0.0.1:1", grpc::InsecureChannelCredentials()), 100ms);
    opts_.force_empty_grant = true;

    Grant grant;
    std::string error;
    ASSERT_TRUE(client.GetLogsGrant(server_config_, opts_, grant, error)) << error;
    EXPECT_TRUE(grant.valid);
    EXPECT_TRUE(grant.config.features.logs);
    EXPECT_TRUE(grant.s3_url.empty());
    EXPECT_FALSE(grant.HasLocalDir());
    EXPECT_TRUE(service_.grant_requests().empty());
}

TEST_F(GrpcGrantClientTest, ValidGrant) {
    collector_proto::GrantResponse response;
    response.set_valid(true);
    response.mutable_config()->set_server_id("srv-1");
    response.mutable_config()->mutable_features()->set_logs(true);
    response.set_s3_url("upload.example.com:443");
    (*response.mutable_s3_fields())["policy"] = "abc";
    service_.SetGrantResponse(response);

    GrpcGrantClient client(Channel(), 5s);
    Grant grant;
    std::string error;
    ASSERT_TRUE(client.GetLogsGrant(server_config_, opts_, grant, error)) << error;

    EXPECT_TRUE(grant.valid);
    EXPECT_EQ(grant.config.server_id, "srv-1");
    EXPECT_TRUE(grant.config.features.logs);
    EXPECT_EQ(grant.config.features.statement_timeout_ms, 30000);
    EXPECT_EQ(grant.s3_url, "upload.example.com:443");
    EXPECT_EQ(grant.s3_fields.at("policy"), "abc");

    auto requests = service_.grant_requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].api_key(), "key-123");
    EXPECT_EQ(requests[0].system_id(), "system-9");
    EXPECT_EQ(requests[0].section_name(), "db1");
    EXPECT_EQ(requests[0].application_name(), "collector-test");
}

TEST_F(GrpcGrantClientTest, InvalidGrantIsStillAnAnswer) {
    collector_proto::GrantResponse response;
    response.set_valid(false);
    service_.SetGrantResponse(response);

    GrpcGrantClient client(Channel(), 5s);
    Grant grant;
    grant.valid = true;
    std::string error;
    ASSERT_TRUE(client.GetLogsGrant(server_config_, opts_, grant, error)) << error;
    EXPECT_FALSE(grant.valid);
}

TEST_F(GrpcGrantClientTest, RpcErrorFails) {
    service_.SetGrantStatus(grpc::Status(grpc::StatusCode::PERMISSION_DENIED, "bad api key"));

    GrpcGrantClient client(Channel(), 5s);
    Grant grant;
    std::string error;
    EXPECT_FALSE(client.GetLogsGrant(server_config_, opts_, grant, error));
    EXPECT_NE(error.find("bad api key"), std::string::npos);
}

TEST_F(GrpcGrantClientTest, UnreachableServerFails) {
    std::string unreachable = target();
    server_->Shutdown();
    server_.reset();

    GrpcGrantClient client(grpc::CreateChannel(unreachable, grpc::InsecureChannelCredentials()), 200ms);
    Grant grant;
    std::string error;
    EXPECT_FALSE(client.GetLogsGrant(server_config_, opts_, grant, error));
    EXPECT_FALSE(error.empty());
}

TEST(GrantFromProtoTest, StatementTimeoutOverride) {
    collector_proto::GrantResponse response;
    response.mutable_config()->mutable_features()->set_statement_timeout_ms(5000);
    response.set_local_dir("/var/lib/collector/out");

    Grant grant;
    GrantFromProto(response, grant);
    EXPECT_EQ(grant.config.features.statement_timeout_ms, 5000);
    EXPECT_TRUE(grant.HasLocalDir());
}
