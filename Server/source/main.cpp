#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <variant>

#include <pthread.h>

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "FileInfoResolver.hpp"
#include "LocalStorage.hpp"
#include "ServerConfig.hpp"
#include "TransferServer.hpp"
#include "TransferServiceImpl.hpp"
#include "TransferSessionRegistry.hpp"

namespace {
    bool PrepareRootDir(const std::filesystem::path& root_dir)
    {
        std::error_code ec;

        std::filesystem::create_directories(root_dir, ec);
        if (ec) {
            spdlog::error("failed to create root directory {}: {}", root_dir.string(), ec.message());
            return false;
        }

        return true;
    }

    sigset_t ShutdownSignals()
    {
        sigset_t set;

        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);

        return set;
    }
}

int main(int argc, char* argv[])
{
    const auto &[success, result] = ParseServerConfig(argc, argv);
    if (!success) {
        spdlog::error("failed to ParseServerConfig(): {}", std::get<std::string>(result));
        return 1;
    }

    const ServerConfig& config = std::get<ServerConfig>(result);
    spdlog::set_level(config.log_level);
    spdlog::info("configuration: {}", ServerConfigToString(config));

    if (!PrepareRootDir(config.root_dir))
        return 1;

    LocalStorage storage(config.root_dir);
    if (auto err = storage.CheckAvailable()) {
        spdlog::error("failed to create storage: {}", err->message);
        return 1;
    }

    TransferSessionRegistry registry(storage, config.exclusive_filenames);
    FileInfoResolver resolver(storage);
    TransferServiceImpl service(registry, resolver, config.idle_timeout);
    spdlog::info("registered service(s): FileTransferService");

    // block before any gRPC thread exists so only sigwait() sees the signals
    const sigset_t signals = ShutdownSignals();
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto logger = spdlog::stdout_color_mt("grpc");
    logger->set_level(config.log_level);

    std::unique_ptr<grpc::Server> server = StartTransferServer(config, service, logger);
    if (!server) {
        spdlog::error("failed to start server on {}:{}", config.host, config.service);
        return 1;
    }
    spdlog::info("server started: listening on {}:{}", config.host, config.service);

    int signo = 0;
    sigwait(&signals, &signo);
    spdlog::info("received signal {}, shutting down with {} transfer(s) in flight", signo, registry.GetActiveCount());

    server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    server->Wait();

    spdlog::info("server stopped");

    return 0;
}
