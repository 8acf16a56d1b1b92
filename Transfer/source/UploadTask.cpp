#include "UploadTask.hpp"

#include <exception>
#include <string>
#include <tuple>

#include "ObjectInfo.hpp"

namespace {
	// Releases a sink that is still open when the transfer scope is left
	// early, so a partially written object is never finalized.
	class SinkGuard
	{
	public:
		SinkGuard(WritableSink& sink, spdlog::logger& logger, const ObjectInfo& object) noexcept
			: sink_(sink), logger_(logger), object_(object) { }

		SinkGuard(const SinkGuard&) = delete;
		SinkGuard& operator=(const SinkGuard&) = delete;

		~SinkGuard()
		{
			if (!sink_.IsOpen())
				return;

			logger_.debug("aborting unfinished write to {}", ObjectName(object_));
			sink_.Abort();
		}

	private:
		WritableSink& sink_;
		spdlog::logger& logger_;
		const ObjectInfo& object_;
	};
}

UploadTask::UploadTask(StorageClient& client, ObjectInfo object, DataSource source,
		       UploadConfig config, WriteOptions options,
		       std::shared_ptr<spdlog::logger> logger)
	: client_(client)
	, object_(std::move(object))
	, source_(std::move(source))
	, config_(std::move(config))
	, options_(std::move(options))
	, logger_(logger ? std::move(logger) : spdlog::default_logger())
{
}

UploadResult UploadTask::Execute() noexcept
{
	if (executed_)
		return UploadResult::FailedToFinish(object_, TransferError::InvalidArgument("upload task has already been executed"));

	executed_ = true;

	std::unique_ptr<WriteSession> session;
	try {
		logger_->debug("uploading {} to {} options={}", source_.Describe(), ObjectName(object_), options_.ToString());

		auto [ok, opened, err] = client_.OpenWriteSession(object_, options_);
		if (!ok)
			return Report(Classify(std::move(err)));

		if (!opened)
			return Report(Classify(TransferError::Internal("storage client returned no write session")));

		session = std::move(opened);

		if (auto terr = Transfer(*session))
			return Report(Classify(std::move(*terr)));
	}
	catch (const std::exception& e) {
		return Report(Classify(TransferError::FromException(e, "upload")));
	}

	try {
		return Report(Finalize(*session));
	}
	catch (const std::exception& e) {
		return Report(UploadResult::FailedToFinish(object_, TransferError::FromException(e, "finalize")));
	}
}

std::optional<TransferError> UploadTask::Transfer(WriteSession& session)
{
	auto [ok, sink, err] = session.Open();
	if (!ok)
		return err;

	if (!sink)
		return TransferError::Internal("write session returned no sink");

	SinkGuard guard(*sink, *logger_, object_);

	const auto [drained, bytes, derr] = source_.DrainTo(*sink, config_.chunk_size);
	if (!drained) {
		logger_->debug("drain of {} stopped after {} bytes", ObjectName(object_), bytes);
		return derr;
	}

	logger_->debug("drained {} bytes into {}", bytes, ObjectName(object_));

	if (auto cerr = sink->Close())
		return cerr;

	return std::nullopt;
}

UploadResult UploadTask::Finalize(WriteSession& session)
{
	auto handle = session.GetResult();
	if (!handle)
		return UploadResult::FailedToFinish(object_, TransferError::Internal("write session returned no completion handle"));

	auto [ok, uploaded, err] = handle->Await(config_.finalize_timeout);
	if (!ok)
		return UploadResult::FailedToFinish(object_, std::move(err));

	return UploadResult::Success(object_, std::move(uploaded));
}

UploadResult UploadTask::Classify(TransferError error) const
{
	if (config_.skip_if_exists && error.IsPreconditionFailure())
		return UploadResult::Skipped(object_, std::move(error));

	return UploadResult::FailedToFinish(object_, std::move(error));
}

UploadResult UploadTask::Report(UploadResult result) const
{
	switch (result.GetStatus()) {
	case TransferStatus::Success:
		logger_->info("{}", result.ToString());
		break;
	case TransferStatus::Skipped:
		logger_->info("{}", result.ToString());
		break;
	case TransferStatus::FailedToFinish:
		logger_->warn("{}", result.ToString());
		break;
	}

	return result;
}
