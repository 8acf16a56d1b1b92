#pragma once

#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

#include "object.pb.h"

#include "DataSource.hpp"
#include "StorageClient.hpp"
#include "TransferError.hpp"
#include "UploadConfig.hpp"
#include "UploadResult.hpp"
#include "WriteOptions.hpp"

// Uploads one source into one object and reports exactly one outcome.
//
// Execute() runs open -> drain -> close -> bounded wait on the calling thread
// and never throws; every failure is folded into the returned UploadResult.
// A task is single use: a second Execute() fails without touching storage.
// The client and a stream source are borrowed and must outlive Execute().
class UploadTask
{
public:
	UploadTask(StorageClient& client, ObjectInfo object, DataSource source,
		   UploadConfig config, WriteOptions options = {},
		   std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

	UploadTask(const UploadTask&) = delete;
	UploadTask& operator=(const UploadTask&) = delete;

public:
	UploadResult Execute() noexcept;

private:
	std::optional<TransferError> Transfer(WriteSession& session);
	UploadResult Finalize(WriteSession& session);

	UploadResult Classify(TransferError error) const;
	UploadResult Report(UploadResult result) const;

private:
	StorageClient& client_;

	const ObjectInfo object_;
	const DataSource source_;
	const UploadConfig config_;
	const WriteOptions options_;

	std::shared_ptr<spdlog::logger> logger_;

	bool executed_ = false;
};
