#include "ChecksumAccumulator.hpp"

#include <vector>

ChecksumAccumulator::ChecksumAccumulator()
	: hasher_(Hasher::Type::SHA256)
{
}

std::optional<Hasher::Error> ChecksumAccumulator::Start() noexcept
{
	if (hasher_.IsActive())
		return std::nullopt;

	return hasher_.Initialize();
}

std::optional<Hasher::Error> ChecksumAccumulator::Update(std::string_view data) noexcept
{
	if (finalized_)
		return Hasher::Error{ -5, "checksum accumulator already finalized" };

	if (auto err = Start())
		return err;

	if (auto err = hasher_.Update(data))
		return err;

	bytes_hashed_ += data.size();

	return std::nullopt;
}

std::tuple<bool, std::string, Hasher::Error> ChecksumAccumulator::Finalize() noexcept
{
	if (finalized_)
		return { false, "", Hasher::Error{ -5, "checksum accumulator already finalized" } };

	// an accumulator that never saw a byte still yields the digest of ""
	if (auto err = Start())
		return { false, "", *err };

	finalized_ = true;

	auto [ok, digest, err] = hasher_.Finalize();
	if (!ok)
		return { false, "", err };

	return { true, Hasher::ToHex(digest), Hasher::Error{ 0, "" } };
}

uint64_t ChecksumAccumulator::GetBytesHashed() const noexcept
{
	return bytes_hashed_;
}

bool ChecksumAccumulator::IsFinalized() const noexcept
{
	return finalized_;
}
