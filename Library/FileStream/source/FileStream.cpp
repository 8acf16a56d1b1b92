#include "FileStream.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>

FileStream::FileStream(const std::filesystem::path& path)
    : path_(path)
{
}

FileStream::~FileStream()
{
    if (stream_.is_open())
        stream_.close();
}

const std::filesystem::path& FileStream::GetPath() const noexcept
{
    return path_;
}

bool FileStream::IsOpen() const noexcept
{
    return stream_.is_open();
}

std::uint64_t FileStream::GetTransferred() const noexcept
{
    return transferred_;
}

std::optional<FileStream::Error> FileStream::Open(std::ios::openmode mode) noexcept
{
    if (stream_.is_open())
        return Error{-1, "open: stream is already open, path=" + path_.string()};

    stream_.clear();
    transferred_ = 0;

    errno = 0;
    stream_.open(path_, mode);
    if (!stream_.is_open() || stream_.fail() || stream_.bad())
        return stream_error(stream_, "open");

    return std::nullopt;
}

std::optional<FileStream::Error> FileStream::Write(std::string_view data) noexcept
{
    if (!stream_.is_open())
        return Error{-1, "write: stream is not open"};

    if (data.empty())
        return std::nullopt;

    errno = 0;
    stream_.write(data.data(), static_cast<std::streamsize>(data.size()));

    if (stream_.bad() || stream_.fail())
        return stream_error(stream_, "write");

    transferred_ += data.size();

    return std::nullopt;
}

std::tuple<bool, std::streamsize, FileStream::Error> FileStream::Read(std::string& data) noexcept
{
    if (data.empty())
        return { true, 0, Error{} };

    return Read(data.data(), static_cast<std::streamsize>(data.size()));
}

std::tuple<bool, std::streamsize, FileStream::Error> FileStream::Read(char* data, std::streamsize size) noexcept
{
    if (!stream_.is_open())
        return { false, 0, Error{ -1, "read: stream is not open"} };

    if (size < 0)
        return { false, 0, Error{ -1, "read: invalid size"} };

    if (size == 0)
        return { true, 0, Error{} };

    if (!data)
        return { false, 0, Error{ -1, "read: null buffer with non-zero size"} };

    errno = 0;
    stream_.read(data, size);
    const std::streamsize n = stream_.gcount();
    transferred_ += static_cast<std::uint64_t>(n);

    // A short read at end of file sets failbit as well as eofbit.
    if (stream_.eof()) {
        stream_.clear(stream_.rdstate() & ~(std::ios::eofbit | std::ios::failbit));
        return { true, n, Error{} };
    }

    if (stream_.bad() || stream_.fail())
        return { false, n, stream_error(stream_, "read") };

    return { true, n, Error{} };
}

std::optional<FileStream::Error> FileStream::Flush() noexcept
{
    if (!stream_.is_open())
        return Error{-1, "flush: stream is not open"};

    errno = 0;
    stream_.flush();
    if (stream_.bad() || stream_.fail())
        return stream_error(stream_, "flush");

    return std::nullopt;
}

std::optional<FileStream::Error> FileStream::Close() noexcept
{
    if (!stream_.is_open())
        return std::nullopt;

    errno = 0;
    stream_.close();

    if (stream_.fail() || stream_.bad())
        return stream_error(stream_, "close");

    return std::nullopt;
}

FileStream::Error FileStream::stream_error(const std::ios& stream, const char* context) const noexcept
{
    const int saved_errno = errno;
    const auto state = stream.rdstate();

    std::ostringstream oss;
    oss << (context ? context : "stream")
        << ": iostate=0x" << std::hex << static_cast<unsigned int>(state) << std::dec;

    if ((state & std::ios::badbit) != 0)  oss << " (badbit)";
    if ((state & std::ios::failbit) != 0) oss << " (failbit)";
    if ((state & std::ios::eofbit) != 0)  oss << " (eofbit)";

    if (saved_errno != 0)
        oss << ", errno=" << saved_errno << " (" << std::strerror(saved_errno) << ")";

    oss << ", path=" << path_.string();

    return Error{ saved_errno != 0 ? saved_errno : static_cast<int>(state), oss.str() };
}
