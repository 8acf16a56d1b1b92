#include "DataSource.hpp"

#include <exception>
#include <vector>

#include <fmt/core.h>

#include "FileStream.hpp"

DataSource DataSource::FromPath(std::filesystem::path path)
{
	DataSource source;
	source.source_ = std::move(path);

	return source;
}

DataSource DataSource::FromStream(std::istream& stream)
{
	DataSource source;
	source.source_ = std::ref(stream);

	return source;
}

DataSource::Kind DataSource::GetKind() const noexcept
{
	switch (source_.index()) {
	case 1:  return Kind::FilePath;
	case 2:  return Kind::ByteStream;
	default: return Kind::None;
	}
}

std::string DataSource::Describe() const
{
	switch (GetKind()) {
	case Kind::FilePath:
		return fmt::format("file:{}", std::get<std::filesystem::path>(source_).string());
	case Kind::ByteStream:
		return "stream";
	case Kind::None:
		break;
	}

	return "none";
}

std::tuple<bool, std::uint64_t, TransferError>
DataSource::DrainTo(WritableSink& sink, std::size_t chunk_size) const
{
	if (chunk_size == 0)
		return { false, 0, TransferError::InvalidArgument("chunk size must be positive") };

	if (const auto* path = std::get_if<std::filesystem::path>(&source_))
		return DrainFile(*path, sink, chunk_size);

	if (const auto* stream = std::get_if<StreamRef>(&source_))
		return DrainStream(stream->get(), sink, chunk_size);

	return { false, 0, TransferError::InvalidArgument("unsupported source: neither a file path nor a byte stream") };
}

std::tuple<bool, std::uint64_t, TransferError>
DataSource::DrainFile(const std::filesystem::path& path, WritableSink& sink, std::size_t chunk_size) const
{
	FileStream file(path);
	if (const auto err = file.Open(std::ios::binary | std::ios::in))
		return { false, 0, TransferError::Io(err->code, "failed to open source: " + err->message) };

	std::vector<char> buffer(chunk_size);
	std::uint64_t total = 0;

	while (true) {
		const auto [ok, len, err] = file.Read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
		if (!ok)
			return { false, total, TransferError::Io(err.code, "failed to read source: " + err.message) };

		if (len <= 0)
			break;

		if (auto werr = sink.Write(std::string_view(buffer.data(), static_cast<std::size_t>(len))))
			return { false, total, *werr };

		total += static_cast<std::uint64_t>(len);
	}

	if (const auto err = file.Close())
		return { false, total, TransferError::Io(err->code, "failed to close source: " + err->message) };

	return { true, total, TransferError{} };
}

std::tuple<bool, std::uint64_t, TransferError>
DataSource::DrainStream(std::istream& stream, WritableSink& sink, std::size_t chunk_size) const
{
	if (stream.fail())
		return { false, 0, TransferError::Io(-1, "source stream is not readable") };

	// Reads go straight to the buffer: a short read at end of stream must not
	// trip a failbit exception mask the caller may have set.
	std::streambuf* buf = stream.rdbuf();
	if (!buf)
		return { false, 0, TransferError::Io(-1, "source stream has no buffer") };

	std::vector<char> buffer(chunk_size);
	std::uint64_t total = 0;

	while (true) {
		std::streamsize len = 0;
		try {
			len = buf->sgetn(buffer.data(), static_cast<std::streamsize>(buffer.size()));
		}
		catch (const std::exception& e) {
			if (stream.exceptions() & std::ios::badbit)
				throw;

			stream.setstate(std::ios::badbit);
			return { false, total, TransferError::Io(-1, fmt::format("failed to read source stream: {}", e.what())) };
		}

		if (len <= 0)
			break;

		if (auto werr = sink.Write(std::string_view(buffer.data(), static_cast<std::size_t>(len))))
			return { false, total, *werr };

		total += static_cast<std::uint64_t>(len);

		if (static_cast<std::size_t>(len) < buffer.size())
			break;
	}

	return { true, total, TransferError{} };
}
