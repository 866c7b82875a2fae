#include "ChannelOptions.hpp"

std::vector<std::pair<std::string, int>> KeepaliveArguments()
{
    return {
        { "grpc.keepalive_time_ms",                        60000 },
        { "grpc.keepalive_timeout_ms",                     10000 },
        { "grpc.keepalive_permit_without_calls",           1 },
        { "grpc.http2.max_pings_without_data",             0 },
        { "grpc.http2.min_time_between_pings_ms",          10000 },
        { "grpc.http2.min_ping_interval_without_data_ms",  300000 },
    };
}

grpc::ChannelArguments MakeChannelArguments(int max_message_size)
{
    grpc::ChannelArguments args;

    for (const auto &[name, value] : KeepaliveArguments())
        args.SetInt(name, value);

    args.SetMaxReceiveMessageSize(max_message_size);
    args.SetMaxSendMessageSize(max_message_size);

    return args;
}
