#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

#include "hash.pb.h"

// A single backend option or precondition. The upload task passes these
// through untouched; only the storage adapter gives them meaning.
class WriteOption
{
public:
	enum class Kind {
		DoesNotExist,
		IfGenerationMatch,
		IfGenerationNotMatch,
		Checksum,
		ContentType
	};

public:
	static WriteOption DoesNotExist();
	static WriteOption IfGenerationMatch(int64_t generation);
	static WriteOption IfGenerationNotMatch(int64_t generation);
	static WriteOption Checksum(HashType hashtype);
	static WriteOption ContentType(std::string content_type);

public:
	Kind GetKind() const noexcept;

	int64_t GetGeneration() const;
	HashType GetHashType() const;
	const std::string& GetContentType() const;

	std::string ToString() const;

private:
	using Value = std::variant<std::monostate, int64_t, HashType, std::string>;

	WriteOption(Kind kind, Value value);

private:
	Kind kind_;
	Value value_;
};

class WriteOptions
{
public:
	WriteOptions() = default;
	WriteOptions(std::initializer_list<WriteOption> options);

public:
	WriteOptions& Add(WriteOption option);

	const std::vector<WriteOption>& GetOptions() const noexcept;
	bool IsEmpty() const noexcept;

	std::string ToString() const;

private:
	std::vector<WriteOption> options_;
};
