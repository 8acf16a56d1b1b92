#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "FileStream.hpp"
#include "Hasher.hpp"

// Write-side file stream that digests every byte it stores. The digest is
// available after a successful Close().
class HashingFileStream final
{
public:
    using Error = FileStream::Error;

public:
    explicit HashingFileStream(const std::filesystem::path& path, Hasher::Type type);

public:
    const std::filesystem::path& GetPath() const noexcept;
    Hasher::Type GetHashType() const noexcept;
    std::uint64_t GetTransferred() const noexcept;

public:
    std::optional<Error> Open(std::ios::openmode mode) noexcept;
    std::optional<Error> Write(std::string_view data) noexcept;
    std::optional<Error> Close() noexcept;

public:
    std::optional<std::vector<uint8_t>> GetHash() const noexcept;
    std::optional<std::string> GetHashHex() const;

private:
    static Error ConvertHasherError(const Hasher::Error& e);

private:
    FileStream file_;
    Hasher hasher_;
    std::optional<std::vector<uint8_t>> digest_;
};
