#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

#include <cxxopts.hpp>
#include <glog/logging.h>
#include <grpcpp/grpcpp.h>

#include "common/configuration.h"
#include "grant/grpc_grant_client.h"
#include "logs/analyzer.h"
#include "logs/dispatcher.h"
#include "logs/test_signal.h"
#include "output/uploaders.h"
#include "runner/log_runner.h"
#include "runner/log_source.h"

namespace {

std::atomic<bool> g_stop{false};

void HandleStopSignal(int) {
    g_stop.store(true);
}

int Run(const cxxopts::ParseResult& result);

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    // Setup command line options
    cxxopts::Options options("collector", "Database log collector");

    options.add_options()
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("c,config", "Configuration file (YAML)", cxxopts::value<std::string>())
        ("f,log_file", "Server log file to follow", cxxopts::value<std::string>())
        ("test", "Check that this collector sees its own identify marker in the logs, then exit")
        ("debug-logs", "Print log lines and metadata instead of sending them")
        ("no-submit", "Collect and analyze, but do not submit")
        ("force-empty-grant", "Do not ask the API for a grant")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        return Run(result);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Invalid arguments or startup failure: " << e.what();
        std::cerr << options.help() << std::endl;
        return 2;
    }
}

namespace {

int Run(const cxxopts::ParseResult& result) {
    FLAGS_v = result["log_level"].as<int>();

    auto& configuration = Collector::Configuration::getInstance();
    if (result.count("config") && !configuration.loadFromFile(result["config"].as<std::string>())) {
        LOG(ERROR) << "Failed to load configuration";
        return 1;
    }
    auto& config = configuration.config();
    if (result.count("log_file")) config.logs.location.set(result["log_file"].as<std::string>());
    if (result.count("test")) config.collection.test_run.set(true);
    if (result.count("debug-logs")) config.collection.debug_logs.set(true);
    if (result.count("no-submit")) config.collection.submit_collected_data.set(false);
    if (result.count("force-empty-grant")) config.collection.force_empty_grant.set(true);

    if (!configuration.validate()) {
        return 1;
    }
    if (config.logs.location.get().empty()) {
        LOG(ERROR) << "No log file given, set logs.location or pass --log_file";
        return 1;
    }

    Collector::Server server;
    server.config.section_name = config.server.section_name.get();
    server.config.api_key = config.server.api_key.get();
    server.config.api_base_url = config.server.api_base_url.get();
    server.config.system_id = config.server.system_id.get();
    server.config.log_location = config.logs.location.get();
    server.config.tmp_dir = config.logs.tmp_dir.get();

    Collector::CollectionOpts opts;
    opts.collect_logs = config.collection.collect_logs.get();
    opts.submit_collected_data = config.collection.submit_collected_data.get();
    opts.debug_logs = config.collection.debug_logs.get();
    opts.test_run = config.collection.test_run.get();
    opts.force_empty_grant = config.collection.force_empty_grant.get();
    opts.collector_application_name = config.collection.application_name.get();

    if (!opts.collect_logs) {
        LOG(INFO) << "[" << server.config.section_name << "] Log collection is disabled, exiting";
        return 0;
    }

    Collector::GrpcGrantClient grant_client(
        grpc::CreateChannel(server.config.api_base_url, grpc::InsecureChannelCredentials()));
    Collector::GrantUploader uploader(
        std::make_unique<Collector::LocalDirUploader>(),
        std::make_unique<Collector::GrpcLogUploader>());
    Collector::PostgresLogAnalyzer analyzer;
    Collector::TestSucceededSignal test_signal;

    Collector::LogDispatcher dispatcher(grant_client, uploader, analyzer, &test_signal,
        std::chrono::milliseconds(configuration.getReadinessWindowMs()));

    // Only lines written after startup are collected
    Collector::FileLogSource source(server.config.log_location);
    Collector::LogRunner runner(server, source, dispatcher, opts,
        std::chrono::milliseconds(configuration.getPollIntervalMs()));

    if (opts.test_run) {
        LOG(INFO) << "[" << server.config.section_name << "] Waiting for the identify marker, run: "
                  << "SELECT '" << Collector::kCollectorIdentifyMarker << server.config.section_name << "'";
        bool ok = runner.RunTest(test_signal,
            std::chrono::milliseconds(config.logs.test_timeout_ms.get()));
        if (ok) {
            LOG(INFO) << "[" << server.config.section_name << "] Log test successful";
            return 0;
        }
        LOG(ERROR) << "[" << server.config.section_name << "] Log test failed: identify marker not seen";
        return 1;
    }

    std::signal(SIGINT, HandleStopSignal);
    std::signal(SIGTERM, HandleStopSignal);

    LOG(INFO) << "[" << server.config.section_name << "] Following " << server.config.log_location;
    runner.Run(g_stop);
    return 0;
}

} // namespace
