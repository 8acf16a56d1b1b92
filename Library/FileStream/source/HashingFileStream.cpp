#include "HashingFileStream.hpp"

#include <sstream>

HashingFileStream::HashingFileStream(const std::filesystem::path& path, Hasher::Type type)
    : file_(path)
    , hasher_(type)
{
}

const std::filesystem::path& HashingFileStream::GetPath() const noexcept
{
    return file_.GetPath();
}

Hasher::Type HashingFileStream::GetHashType() const noexcept
{
    return hasher_.GetType();
}

std::uint64_t HashingFileStream::GetTransferred() const noexcept
{
    return file_.GetTransferred();
}

std::optional<HashingFileStream::Error> HashingFileStream::Open(std::ios::openmode mode) noexcept
{
    digest_.reset();

    if (auto err = file_.Open(mode))
        return err;

    if (auto herr = hasher_.Initialize()) {
        (void)file_.Close();
        return ConvertHasherError(*herr);
    }

    return std::nullopt;
}

std::optional<HashingFileStream::Error> HashingFileStream::Write(std::string_view data) noexcept
{
    if (auto err = file_.Write(data))
        return err;

    if (data.empty())
        return std::nullopt;

    if (auto herr = hasher_.Update(data))
        return ConvertHasherError(*herr);

    return std::nullopt;
}

std::optional<HashingFileStream::Error> HashingFileStream::Close() noexcept
{
    if (!file_.IsOpen())
        return std::nullopt;

    auto [ok, digest, herr] = hasher_.Finalize();
    if (!ok) {
        (void)file_.Close();
        return ConvertHasherError(herr);
    }

    if (auto err = file_.Close())
        return err;

    digest_ = std::move(digest);

    return std::nullopt;
}

std::optional<std::vector<uint8_t>> HashingFileStream::GetHash() const noexcept
{
    return digest_;
}

std::optional<std::string> HashingFileStream::GetHashHex() const
{
    if (!digest_.has_value())
        return std::nullopt;

    return Hasher::ToHex(*digest_);
}

HashingFileStream::Error HashingFileStream::ConvertHasherError(const Hasher::Error& e)
{
    std::ostringstream oss;
    oss << "hasher: (" << e.code << ") " << e.message;
    return Error{ e.code, oss.str() };
}
