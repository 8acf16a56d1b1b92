#include "UploadResult.hpp"

#include <fmt/core.h>

#include "ObjectInfo.hpp"

const char* TransferStatusToString(TransferStatus status) noexcept
{
	switch (status) {
	case TransferStatus::Success:        return "SUCCESS";
	case TransferStatus::Skipped:        return "SKIPPED";
	case TransferStatus::FailedToFinish: return "FAILED_TO_FINISH";
	}

	return "UNKNOWN";
}

UploadResult::UploadResult(ObjectInfo source, TransferStatus status,
			   std::optional<ObjectInfo> uploaded, std::optional<TransferError> error)
	: source_(std::move(source))
	, status_(status)
	, uploaded_(std::move(uploaded))
	, error_(std::move(error))
{
}

UploadResult UploadResult::Success(ObjectInfo source, ObjectInfo uploaded)
{
	return UploadResult(std::move(source), TransferStatus::Success, std::move(uploaded), std::nullopt);
}

UploadResult UploadResult::Skipped(ObjectInfo source, TransferError error)
{
	return UploadResult(std::move(source), TransferStatus::Skipped, std::nullopt, std::move(error));
}

UploadResult UploadResult::FailedToFinish(ObjectInfo source, TransferError error)
{
	return UploadResult(std::move(source), TransferStatus::FailedToFinish, std::nullopt, std::move(error));
}

const ObjectInfo& UploadResult::GetSourceObject() const noexcept
{
	return source_;
}

TransferStatus UploadResult::GetStatus() const noexcept
{
	return status_;
}

const std::optional<ObjectInfo>& UploadResult::GetUploadedObject() const noexcept
{
	return uploaded_;
}

const std::optional<TransferError>& UploadResult::GetError() const noexcept
{
	return error_;
}

std::string UploadResult::ToString() const
{
	if (uploaded_)
		return fmt::format("{} {} (generation={})", TransferStatusToString(status_),
				   ObjectName(source_), uploaded_->generation());

	if (error_)
		return fmt::format("{} {}: {}", TransferStatusToString(status_),
				   ObjectName(source_), error_->ToString());

	return fmt::format("{} {}", TransferStatusToString(status_), ObjectName(source_));
}
