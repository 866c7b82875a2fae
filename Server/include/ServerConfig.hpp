#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <variant>

#include <spdlog/common.h>

struct ServerConfig {
	std::string host = "[::]";
	std::string service = "50051";
	std::filesystem::path root_dir = "./uploads";

	spdlog::level::level_enum log_level = spdlog::level::info;

	std::chrono::milliseconds idle_timeout{60000};
	int max_message_size = 100 * 1024 * 1024;
	int max_threads = 50;
	bool exclusive_filenames = true;
};

// Parses the server command line. On failure the variant holds the error or
// usage text.
std::pair<bool, std::variant<ServerConfig, std::string>> ParseServerConfig(int argc, char* argv[]);

std::string ServerConfigToString(const ServerConfig& config);
