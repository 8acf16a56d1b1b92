#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "FileStream.hpp"
#include "HashingFileStream.hpp"

#include "object.pb.h"
#include "storage_service.pb.h"
#include "hash.pb.h"

// An object being received. Bytes go to `temp_path`; ObjectStore::Commit
// moves the file to `final_path`. An uncommitted temporary file is removed
// when the pending object is destroyed.
struct PendingObject {
	PendingObject() = default;
	~PendingObject();

	PendingObject(const PendingObject&) = delete;
	PendingObject& operator=(const PendingObject&) = delete;

	std::string upload_id;

	ObjectInfo requested;
	WritePreconditions preconditions;

	std::filesystem::path temp_path;
	std::filesystem::path final_path;

	bool hashing_enabled = false;
	HashType hash_type = HASH_TYPE_UNSPECIFIED;

	bool committed = false;

	std::unique_ptr<FileStream> plain;
	std::unique_ptr<HashingFileStream> hashing;

	std::optional<FileStream::Error> Open() noexcept;
	std::optional<FileStream::Error> Write(std::string_view data) noexcept;
	std::optional<FileStream::Error> Close() noexcept;

	std::uint64_t GetReceived() const noexcept;
	std::optional<std::vector<uint8_t>> GetHash() const noexcept;
};
