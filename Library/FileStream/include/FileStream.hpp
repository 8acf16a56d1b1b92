#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

// Scoped file handle. The underlying stream is closed at most once, either by
// Close() or by the destructor.
class FileStream {
public:
	struct Error {
		int code = 0;
		std::string message;
	};

public:
	explicit FileStream(const std::filesystem::path& path);
	virtual ~FileStream();

	FileStream(const FileStream&) = delete;
	FileStream& operator=(const FileStream&) = delete;

public:
	const std::filesystem::path& GetPath() const noexcept;
	bool IsOpen() const noexcept;

	// Bytes written since Open(), or read since Open() for input streams.
	std::uint64_t GetTransferred() const noexcept;

public:
	virtual std::optional<Error> Open(std::ios::openmode mode) noexcept;
	virtual std::optional<Error> Write(std::string_view data) noexcept;

	virtual std::tuple<bool, std::streamsize, Error> Read(std::string& data) noexcept;
	virtual std::tuple<bool, std::streamsize, Error> Read(char* data, std::streamsize size) noexcept;

	virtual std::optional<Error> Flush() noexcept;
	virtual std::optional<Error> Close() noexcept;

private:
	Error stream_error(const std::ios& stream, const char* context) const noexcept;

private:
	const std::filesystem::path path_;
	std::fstream stream_;
	std::uint64_t transferred_ = 0;
};
