#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

#include <grpcpp/grpcpp.h>

#include "object.pb.h"
#include "storage_service.pb.h"
#include "hash.pb.h"

#include "PendingObject.hpp"

// Objects kept as plain files under <root>/<bucket>/<name>. Uploads are
// staged in <root>/<bucket>/.uploads and renamed into place on commit.
class ObjectStore final
{
public:
	static constexpr const char* kStagingDirectory = ".uploads";

public:
	explicit ObjectStore(const std::filesystem::path& root);

public:
	bool IsValid() const noexcept;
	const std::filesystem::path& GetRoot() const noexcept;

	std::tuple<bool, std::unique_ptr<PendingObject>, grpc::Status> BeginWrite(const WriteInit& init) noexcept;
	// Verifies the received bytes against `expected` (when hashing is
	// enabled) and the preconditions, then moves the object into place.
	std::tuple<bool, ObjectInfo, grpc::Status> Commit(PendingObject& pending, const Hash& expected) noexcept;

	std::optional<ObjectInfo> Stat(const std::string& bucket, const std::string& name) const;

private:
	std::tuple<bool, std::filesystem::path, grpc::Status> ResolvePath(const std::string& bucket, const std::string& name) const noexcept;
	grpc::Status CheckPreconditions(const std::filesystem::path& path, const WritePreconditions& preconditions) const noexcept;
	std::string NextUploadId();

private:
	const std::filesystem::path root_;

	std::mutex commit_mutex_;
	std::atomic<uint64_t> next_upload_id_{1};
};
