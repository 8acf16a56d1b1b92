#pragma once

#include "object.pb.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

// Initial metadata entry a WriteObject call answers with once the server has
// accepted its WriteInit.
inline constexpr char kUploadIdMetadataKey[] = "x-upload-id";

ObjectInfo MakeObjectInfo(std::string bucket, std::string name);

// Describes an object stored at `from`, keeping the identity and user
// supplied attributes of `requested`.
ObjectInfo MakeObjectInfoFrom(const std::filesystem::path& from, const ObjectInfo& requested);

// Generation of a stored object: its modification time in microseconds.
std::optional<int64_t> GenerationOf(const std::filesystem::path& path) noexcept;

std::string ObjectName(const ObjectInfo& info);
std::string ObjectInfoToString(const ObjectInfo& info);
