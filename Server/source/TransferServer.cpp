#include "TransferServer.hpp"

#include <vector>

#include <grpcpp/resource_quota.h>

#include "ChannelOptions.hpp"
#include "ServerInterceptor.hpp"

std::unique_ptr<grpc::Server> StartTransferServer(const ServerConfig& config,
                                                  TransferServiceImpl& service,
                                                  std::shared_ptr<spdlog::logger> logger,
                                                  int* selected_port)
{
    grpc::ServerBuilder builder;

    const std::string address = fmt::format("{}:{}", config.host, config.service);
    builder.AddListeningPort(address, grpc::InsecureServerCredentials(), selected_port);
    builder.RegisterService(&service);

    builder.SetMaxReceiveMessageSize(config.max_message_size);
    builder.SetMaxSendMessageSize(config.max_message_size);
    for (const auto &[name, value] : KeepaliveArguments())
        builder.AddChannelArgument(name, value);

    grpc::ResourceQuota quota("file-transfer");
    quota.SetMaxThreads(config.max_threads);
    builder.SetResourceQuota(quota);

    std::vector<std::unique_ptr<grpc::experimental::ServerInterceptorFactoryInterface>> creators;
    creators.push_back(std::make_unique<ServerInterceptorFactory>(std::move(logger)));
    builder.experimental().SetInterceptorCreators(std::move(creators));

    return builder.BuildAndStart();
}
