#pragma once

#include <optional>
#include <string>

#include "object.pb.h"

#include "TransferError.hpp"

enum class TransferStatus {
	Success,
	Skipped,
	FailedToFinish
};

const char* TransferStatusToString(TransferStatus status) noexcept;

// Outcome of one upload. Only the factories can build one, so a success
// always carries the uploaded object and every other status an error.
class UploadResult
{
public:
	static UploadResult Success(ObjectInfo source, ObjectInfo uploaded);
	static UploadResult Skipped(ObjectInfo source, TransferError error);
	static UploadResult FailedToFinish(ObjectInfo source, TransferError error);

public:
	const ObjectInfo& GetSourceObject() const noexcept;
	TransferStatus GetStatus() const noexcept;
	const std::optional<ObjectInfo>& GetUploadedObject() const noexcept;
	const std::optional<TransferError>& GetError() const noexcept;

	std::string ToString() const;

private:
	UploadResult(ObjectInfo source, TransferStatus status,
		     std::optional<ObjectInfo> uploaded, std::optional<TransferError> error);

private:
	ObjectInfo source_;
	TransferStatus status_;
	std::optional<ObjectInfo> uploaded_;
	std::optional<TransferError> error_;
};
