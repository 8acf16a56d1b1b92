#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <string>
#include <tuple>
#include <variant>

#include "StorageClient.hpp"
#include "TransferError.hpp"
#include "UploadConfig.hpp"

// Where the bytes of an upload come from. A default constructed source is
// empty and every drain from it fails with an invalid-argument error.
//
// A stream source is borrowed: the caller keeps ownership and the stream is
// never closed here. A file source is opened read-only for the duration of a
// single DrainTo() call.
class DataSource
{
public:
	enum class Kind {
		None,
		FilePath,
		ByteStream
	};

public:
	DataSource() = default;

	static DataSource FromPath(std::filesystem::path path);
	static DataSource FromStream(std::istream& stream);

public:
	Kind GetKind() const noexcept;
	std::string Describe() const;

	// Copies every remaining byte into `sink`. Returns the number of bytes
	// copied; on failure the count is what reached the sink before it.
	std::tuple<bool, std::uint64_t, TransferError>
	DrainTo(WritableSink& sink, std::size_t chunk_size = UploadConfig::kDefaultChunkSize) const;

private:
	using StreamRef = std::reference_wrapper<std::istream>;

	std::tuple<bool, std::uint64_t, TransferError> DrainFile(const std::filesystem::path& path, WritableSink& sink, std::size_t chunk_size) const;
	std::tuple<bool, std::uint64_t, TransferError> DrainStream(std::istream& stream, WritableSink& sink, std::size_t chunk_size) const;

private:
	std::variant<std::monostate, std::filesystem::path, StreamRef> source_;
};
