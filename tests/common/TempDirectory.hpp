#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>

// Unique directory under the system temp dir, removed with its contents.
class TempDirectory
{
public:
	TempDirectory()
	{
		std::string pattern = (std::filesystem::temp_directory_path() / "objtransfer-XXXXXX").string();
		if (!mkdtemp(pattern.data()))
			throw std::runtime_error("mkdtemp failed");

		path_ = pattern;
	}

	~TempDirectory()
	{
		std::error_code ec;
		std::filesystem::remove_all(path_, ec);
	}

	TempDirectory(const TempDirectory&) = delete;
	TempDirectory& operator=(const TempDirectory&) = delete;

	const std::filesystem::path& Path() const noexcept { return path_; }

	std::filesystem::path WriteFile(const std::string& name, const std::string& content) const
	{
		const auto path = path_ / name;
		std::filesystem::create_directories(path.parent_path());

		std::ofstream out(path, std::ios::binary | std::ios::trunc);
		out << content;

		return path;
	}

private:
	std::filesystem::path path_;
};

inline std::string ReadFile(const std::filesystem::path& path)
{
	std::ifstream in(path, std::ios::binary);
	return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}
