#pragma once

#include <string>
#include <utility>
#include <vector>

#include <grpcpp/support/channel_arguments.h>

constexpr int kDefaultMaxMessageSize = 100 * 1024 * 1024;

// Room left in a message for the filename and field framing around a chunk's
// data.
constexpr int kChunkEnvelopeReserve = 64 * 1024;

// HTTP/2 keepalive settings shared by the server and its clients, so long
// transfers over idle-looking links are not dropped by either side.
std::vector<std::pair<std::string, int>> KeepaliveArguments();

grpc::ChannelArguments MakeChannelArguments(int max_message_size = kDefaultMaxMessageSize);
