#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <Poco/Exception.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "chunkshare/core/config.h"
#include "chunkshare/core/logger.h"
#include "chunkshare/http/http_server.h"
#include "chunkshare/http/route_registration.h"
#include "chunkshare/http/router.h"
#include "chunkshare/metadata/sqlite_repository.h"
#include "chunkshare/upload/finalize_queue.h"
#include "chunkshare/upload/finalize_worker.h"

namespace {

constexpr int kRecoveryBatch = 1000;

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/server.json");
    const std::string db_path = GetArgValue(argc, argv, "--database", "config/database.json");

    chunkshare::core::Config config;
    std::string sqlite_path;
    try {
        config = chunkshare::core::LoadConfig(config_path);
        sqlite_path = chunkshare::core::LoadDatabasePath(db_path);
    } catch (const Poco::Exception& ex) {
        std::cerr << "failed to load configuration: " << ex.displayText() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "invalid configuration: " << ex.what() << std::endl;
        return 1;
    }
    chunkshare::core::InitLogging(config.observability.log_level);

    std::shared_ptr<chunkshare::metadata::SqliteRepository> repository;
    try {
        const auto parent = std::filesystem::path(sqlite_path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        repository = std::make_shared<chunkshare::metadata::SqliteRepository>(sqlite_path);
    } catch (const std::exception& ex) {
        chunkshare::core::LogError("Failed to open metadata database " + sqlite_path + ": " +
                                   ex.what());
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(config.storage.tmp_dir, ec);
    if (!ec) {
        std::filesystem::create_directories(config.storage.files_dir, ec);
    }
    if (ec) {
        chunkshare::core::LogError("Failed to create storage directories: " + ec.message());
        return 1;
    }

    auto store = std::make_shared<chunkshare::storage::ChunkStore>(config.storage.tmp_dir,
                                                                  config.storage.files_dir);
    auto codec = std::make_shared<chunkshare::auth::JwtCodec>(config.auth.token_secret,
                                                             config.auth.clock_skew_seconds);
    chunkshare::upload::FinalizeWorker worker(*repository, *store);
    chunkshare::upload::AsioFinalizeQueue queue(worker, config.uploads.finalize_workers);

    chunkshare::http::AppServices services;
    services.config = config;
    services.repository = repository;
    services.store = store;
    services.codec = codec;
    services.sessions = std::make_shared<chunkshare::upload::SessionManager>(
        *repository, *store, queue, config.uploads);
    services.links =
        std::make_shared<chunkshare::links::LinkEngine>(*repository, *codec, config.links);
    services.files = std::make_shared<chunkshare::files::FileService>(*repository, *store);

    // Jobs queued before a restart are redelivered; the worker skips already-settled files.
    auto recovered = services.sessions->RecoverPendingFinalizations(kRecoveryBatch);
    if (!recovered.ok()) {
        chunkshare::core::LogError("Failed to recover pending finalizations: " +
                                   recovered.error().message);
    } else if (recovered.value() > 0) {
        chunkshare::core::LogInfo("Requeued " + std::to_string(recovered.value()) +
                                  " pending finalization(s)");
    }

    chunkshare::http::Router router;
    chunkshare::http::RegisterDefaultRoutes(router, services);

    boost::asio::io_context ioc(config.server.threads);
    std::unique_ptr<chunkshare::http::HttpServer> server;
    try {
        server = std::make_unique<chunkshare::http::HttpServer>(ioc, services, std::move(router));
    } catch (const std::exception& ex) {
        chunkshare::core::LogError(std::string("Failed to load TLS material: ") + ex.what());
        queue.Shutdown();
        return 1;
    }
    if (!server->Run()) {
        queue.Shutdown();
        return 1;
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc](const boost::system::error_code&, int signal) {
        chunkshare::core::LogInfo("Received signal " + std::to_string(signal) + ", stopping");
        ioc.stop();
    });

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(config.server.threads));
    for (int i = 0; i < config.server.threads; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    queue.Shutdown();
    return 0;
}
