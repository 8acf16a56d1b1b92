#include "PendingObject.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

PendingObject::~PendingObject()
{
	if (committed || temp_path.empty())
		return;

	if (auto err = Close())
		spdlog::debug("upload {}: {}", upload_id, err->message);

	std::error_code ec;
	std::filesystem::remove(temp_path, ec);
	if (ec)
		spdlog::warn("upload {}: failed to remove {}: {}", upload_id, temp_path.string(), ec.message());
}

std::optional<FileStream::Error> PendingObject::Open() noexcept
{
	const auto mode = std::ios::binary | std::ios::out | std::ios::trunc;

	if (hashing) return hashing->Open(mode);
	if (plain)   return plain->Open(mode);
	return FileStream::Error{ -1, "pending object: no stream object" };
}

std::optional<FileStream::Error> PendingObject::Write(std::string_view data) noexcept
{
	if (hashing) return hashing->Write(data);
	if (plain)   return plain->Write(data);
	return FileStream::Error{ -1, "pending object: no stream object" };
}

std::optional<FileStream::Error> PendingObject::Close() noexcept
{
	if (hashing) return hashing->Close();
	if (plain)   return plain->Close();
	return std::nullopt;
}

std::uint64_t PendingObject::GetReceived() const noexcept
{
	if (hashing) return hashing->GetTransferred();
	if (plain)   return plain->GetTransferred();
	return 0;
}

std::optional<std::vector<uint8_t>> PendingObject::GetHash() const noexcept
{
	if (hashing) return hashing->GetHash();
	return std::nullopt;
}
