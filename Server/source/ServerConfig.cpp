#include "ServerConfig.hpp"

#include <cerrno>
#include <cstdlib>
#include <optional>

#include <getopt.h>

#include <spdlog/spdlog.h>

namespace {
	std::optional<long long> ParseInteger(const char* text, long long min, long long max)
	{
		if (!text || *text == '\0')
			return std::nullopt;

		errno = 0;
		char* end = nullptr;
		const long long value = std::strtoll(text, &end, 10);
		if (errno != 0 || *end != '\0' || value < min || value > max)
			return std::nullopt;

		return value;
	}

	std::optional<spdlog::level::level_enum> ParseLevel(const std::string& name)
	{
		const auto level = spdlog::level::from_str(name);
		if (level == spdlog::level::off && name != "off")
			return std::nullopt;

		return level;
	}

	std::string Usage(const char* program)
	{
		return fmt::format("usage: {} [--loglevel <level>] [--root-dir <directory>] [--idle-timeout <ms>] "
				   "[--max-message-size <bytes>] [--max-threads <n>] [--shared-filenames] [<host> [<service>]]",
				   program ? program : "file_transfer_server");
	}
}

std::pair<bool, std::variant<ServerConfig, std::string>> ParseServerConfig(int argc, char* argv[])
{
    ServerConfig config;

    const struct option options[] = {
            { "loglevel",         required_argument, nullptr, 'l' },
            { "root-dir",         required_argument, nullptr, 'r' },
            { "idle-timeout",     required_argument, nullptr, 't' },
            { "max-message-size", required_argument, nullptr, 'm' },
            { "max-threads",      required_argument, nullptr, 'w' },
            { "shared-filenames", no_argument,       nullptr, 's' },
            { "help",             no_argument,       nullptr, 'h' },
            { nullptr, 0, nullptr, 0 }
    };

    // restart scanning; the parser may run more than once per process
    optind = 0;
    opterr = 0;

    int optidx;
    for (int opt; (opt = getopt_long(argc, argv, ":l:r:t:m:w:sh", options, &optidx)) != -1; ) {
        switch (opt) {
        case 'l': {
            auto level = ParseLevel(optarg);
            if (!level)
                return { false, fmt::format("invalid log level: {}", optarg) };
            config.log_level = *level;
            break;
        }
        case 'r':
            config.root_dir = optarg;
            break;
        case 't': {
            auto ms = ParseInteger(optarg, 0, 24LL * 60 * 60 * 1000);
            if (!ms)
                return { false, fmt::format("invalid idle timeout: {}", optarg) };
            config.idle_timeout = std::chrono::milliseconds(*ms);
            break;
        }
        case 'm': {
            auto bytes = ParseInteger(optarg, 1024, 1LL << 30);
            if (!bytes)
                return { false, fmt::format("invalid max message size: {}", optarg) };
            config.max_message_size = static_cast<int>(*bytes);
            break;
        }
        case 'w': {
            auto n = ParseInteger(optarg, 1, 4096);
            if (!n)
                return { false, fmt::format("invalid thread count: {}", optarg) };
            config.max_threads = static_cast<int>(*n);
            break;
        }
        case 's':
            config.exclusive_filenames = false;
            break;
        case 'h':
            return { false, Usage(argv[0]) };
        case ':':
            return { false, fmt::format("missing argument for {}", argv[optind - 1]) };
        case '?':
        default:
            return { false, fmt::format("invalid argument: {}\n{}", argv[optind - 1], Usage(argv[0])) };
        }
    }

    const int remaining = argc - optind;
    if (remaining > 2)
        return { false, Usage(argv[0]) };

    if (remaining >= 1)
        config.host = argv[optind];
    if (remaining == 2)
        config.service = argv[optind + 1];

    if (config.root_dir.empty())
        return { false, "root directory must not be empty" };

    return { true, config };
}

std::string ServerConfigToString(const ServerConfig& config)
{
    return fmt::format("host={} service={} root-dir={} loglevel={} idle-timeout={}ms "
                       "max-message-size={} max-threads={} exclusive-filenames={}",
                       config.host, config.service, config.root_dir.string(),
                       spdlog::level::to_string_view(config.log_level), config.idle_timeout.count(),
                       config.max_message_size, config.max_threads, config.exclusive_filenames);
}
