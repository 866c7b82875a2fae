#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "ServerConfig.hpp"
#include "TransferServiceImpl.hpp"

// Builds and starts a server for the service with the configured listening
// address, limits and call logging. Returns nullptr if the server could not
// start. selected_port receives the bound port (useful with service "0").
std::unique_ptr<grpc::Server> StartTransferServer(const ServerConfig& config,
						  TransferServiceImpl& service,
						  std::shared_ptr<spdlog::logger> logger,
						  int* selected_port = nullptr);
