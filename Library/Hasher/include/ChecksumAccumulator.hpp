#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "Hasher.hpp"

// Running SHA-256 over the bytes of one file, in the order they were fed.
// Finalize() may be called once; the accumulator is spent afterwards.
class ChecksumAccumulator
{
public:
	ChecksumAccumulator();

public:
	std::optional<Hasher::Error> Update(std::string_view data) noexcept;
	std::tuple<bool, std::string, Hasher::Error> Finalize() noexcept;

	uint64_t GetBytesHashed() const noexcept;
	bool IsFinalized() const noexcept;

private:
	std::optional<Hasher::Error> Start() noexcept;

private:
	Hasher hasher_;
	uint64_t bytes_hashed_ = 0;
	bool finalized_ = false;
};
