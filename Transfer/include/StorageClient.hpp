#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string_view>
#include <tuple>

#include "object.pb.h"

#include "TransferError.hpp"
#include "WriteOptions.hpp"

// Caller side of an open write channel. Exactly one of Close() or Abort()
// takes effect, and the sink is released afterwards even if Close() failed;
// later calls to either are no-ops.
class WritableSink
{
public:
	virtual ~WritableSink() = default;

public:
	virtual std::optional<TransferError> Write(std::string_view data) noexcept = 0;

	// Ends the byte stream and asks the backend to finalize the object.
	virtual std::optional<TransferError> Close() noexcept = 0;

	// Releases the channel without finalizing the object.
	virtual void Abort() noexcept = 0;

	virtual bool IsOpen() const noexcept = 0;
};

// Resolves to the finalized object once the backend confirms it.
class CompletionHandle
{
public:
	virtual ~CompletionHandle() = default;

public:
	virtual std::tuple<bool, ObjectInfo, TransferError> Await(std::chrono::milliseconds timeout) noexcept = 0;
};

class WriteSession
{
public:
	virtual ~WriteSession() = default;

public:
	virtual std::tuple<bool, std::unique_ptr<WritableSink>, TransferError> Open() noexcept = 0;

	// Valid once the sink returned by Open() has been closed.
	virtual std::unique_ptr<CompletionHandle> GetResult() noexcept = 0;
};

class StorageClient
{
public:
	virtual ~StorageClient() = default;

public:
	virtual std::tuple<bool, std::unique_ptr<WriteSession>, TransferError>
	OpenWriteSession(const ObjectInfo& object, const WriteOptions& options) noexcept = 0;
};
