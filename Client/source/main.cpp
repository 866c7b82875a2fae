#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <variant>

#include <getopt.h>

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "ChannelOptions.hpp"
#include "FileTransferClient.hpp"

using ArgList = std::map<std::string, std::string>;

std::pair<bool, std::variant<ArgList, std::string>> ParseArgument(int argc, char* argv[])
{
        ArgList arglist;

        const struct option options[] = {
                { "loglevel",   required_argument, nullptr, 'l' },
                { "chunk-size", required_argument, nullptr, 'c' },
                { "info",       no_argument,       nullptr, 'i' },
                { nullptr, 0, nullptr, 0 }
        };

        int optidx;
        for (int opt; (opt = getopt_long(argc, argv, "l:c:i", options, &optidx)) != -1; ) {
                switch (opt) {
                case 'l':
                        arglist["loglevel"] = optarg;
                        break;
                case 'c':
                        arglist["chunk-size"] = optarg;
                        break;
                case 'i':
                        arglist["info"] = "true";
                        break;
                case ':':
                        return { false, fmt::format("missing argument: {}", static_cast<char>(optopt)) };
                case '?':
                        return { false, fmt::format("invalid argument: {}", static_cast<char>(optopt)) };
                }
        }

        if (argc - optind < 3)
                return { false, fmt::format("usage: {} [--loglevel <level>] [--chunk-size <bytes>] [--info] <host> <service> <file>", *argv) };

        argv += optind;

        arglist["host"] = *argv++;
        arglist["service"] = *argv++;
        arglist["file"] = *argv++;

        if (arglist.find("loglevel") == arglist.end())
                arglist["loglevel"] = "info";

        if (arglist.find("chunk-size") == arglist.end())
                arglist["chunk-size"] = std::to_string(FileTransferClient::kDefaultChunkSize);

        return { true, arglist };
}

void ShowArgument(const ArgList& arglist)
{
        for (const auto &[name, value]: arglist)
                spdlog::debug("{}: {}", name, value);
}

int QueryInfo(FileTransferClient& client, const std::string& name)
{
        const auto [ok, info, err] = client.GetFileInfo(name);
        if (!ok) {
                spdlog::error("failed to query file info: ({}) {}", err.code, err.message);
                return 1;
        }

        if (!info.exists()) {
                spdlog::info("{}: not found on server", name);
                return 1;
        }

        spdlog::info("{}: {} bytes, sha256 {}", name, info.file_size(), info.checksum());
        return 0;
}

int main(int argc, char* argv[])
{
        const auto &[success, result] = ParseArgument(argc, argv);
        if (!success) {
                spdlog::error("failed to ParseArgument(): {}", std::get<std::string>(result));
                return 1;
        }

        const ArgList& arglist = std::get<ArgList>(result);
        spdlog::set_level(spdlog::level::from_str(arglist.at("loglevel")));
        ShowArgument(arglist);

        const long long chunk_size = std::atoll(arglist.at("chunk-size").c_str());
        if (!FileTransferClient::IsValidChunkSize(chunk_size)) {
                spdlog::error("invalid chunk size: {} (must be 1..{})", arglist.at("chunk-size"),
                              kDefaultMaxMessageSize - kChunkEnvelopeReserve);
                return 1;
        }

        const std::string target = fmt::format("{}:{}", arglist.at("host"), arglist.at("service"));
        std::shared_ptr<grpc::Channel> channel = grpc::CreateCustomChannel(target, grpc::InsecureChannelCredentials(), MakeChannelArguments());
        spdlog::info("channel opened at: {}", target);

        FileTransferClient client(channel, static_cast<size_t>(chunk_size));

        if (arglist.count("info"))
                return QueryInfo(client, arglist.at("file"));

        const std::filesystem::path infile = arglist.at("file");
        const std::string remote_name = infile.filename().string();

        const auto [sent, response, status] = client.SendFile(infile, remote_name);
        if (!sent) {
                spdlog::error("failed to send file: ({}) {}", status.code, status.message);
                return 1;
        }

        if (!response.success()) {
                spdlog::error("transfer rejected: {} ({} bytes stored)", response.message(), response.bytes_received());
                return 1;
        }
        spdlog::info("{}", response.message());

        const auto [verified, match, verr] = client.VerifyFile(remote_name, infile);
        if (!verified) {
                spdlog::error("failed to verify file: ({}) {}", verr.code, verr.message);
                return 1;
        }

        if (!match) {
                spdlog::error("verification failed: checksums do not match");
                return 1;
        }
        spdlog::info("verification succeeded: checksums match");

        return 0;
}
