#include "WriteOptions.hpp"

#include <fmt/core.h>

WriteOption::WriteOption(Kind kind, Value value)
	: kind_(kind)
	, value_(std::move(value))
{
}

WriteOption WriteOption::DoesNotExist()
{
	return WriteOption(Kind::DoesNotExist, std::monostate{});
}

WriteOption WriteOption::IfGenerationMatch(int64_t generation)
{
	return WriteOption(Kind::IfGenerationMatch, generation);
}

WriteOption WriteOption::IfGenerationNotMatch(int64_t generation)
{
	return WriteOption(Kind::IfGenerationNotMatch, generation);
}

WriteOption WriteOption::Checksum(HashType hashtype)
{
	return WriteOption(Kind::Checksum, hashtype);
}

WriteOption WriteOption::ContentType(std::string content_type)
{
	return WriteOption(Kind::ContentType, std::move(content_type));
}

WriteOption::Kind WriteOption::GetKind() const noexcept
{
	return kind_;
}

int64_t WriteOption::GetGeneration() const
{
	return std::get<int64_t>(value_);
}

HashType WriteOption::GetHashType() const
{
	return std::get<HashType>(value_);
}

const std::string& WriteOption::GetContentType() const
{
	return std::get<std::string>(value_);
}

std::string WriteOption::ToString() const
{
	switch (kind_) {
	case Kind::DoesNotExist:
		return "does-not-exist";
	case Kind::IfGenerationMatch:
		return fmt::format("if-generation-match={}", GetGeneration());
	case Kind::IfGenerationNotMatch:
		return fmt::format("if-generation-not-match={}", GetGeneration());
	case Kind::Checksum:
		return fmt::format("checksum={}", HashType_Name(GetHashType()));
	case Kind::ContentType:
		return fmt::format("content-type={}", GetContentType());
	}

	return "unknown";
}

WriteOptions::WriteOptions(std::initializer_list<WriteOption> options)
	: options_(options)
{
}

WriteOptions& WriteOptions::Add(WriteOption option)
{
	options_.push_back(std::move(option));

	return *this;
}

const std::vector<WriteOption>& WriteOptions::GetOptions() const noexcept
{
	return options_;
}

bool WriteOptions::IsEmpty() const noexcept
{
	return options_.empty();
}

std::string WriteOptions::ToString() const
{
	std::string out = "[";
	for (std::size_t i = 0; i < options_.size(); i++) {
		if (i != 0)
			out += ", ";
		out += options_[i].ToString();
	}
	out += "]";

	return out;
}
