#include "ObjectStore.hpp"

#include <chrono>
#include <cstring>
#include <system_error>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "ObjectInfo.hpp"

namespace fs = std::filesystem;

namespace {
	static std::optional<Hasher::Type> MapHasherType(HashType t) noexcept
	{
		switch (t) {
		case HASH_TYPE_SHA256: return Hasher::Type::SHA256;
		case HASH_TYPE_SHA512: return Hasher::Type::SHA512;
		default: return std::nullopt;
		}
	}

	static grpc::Status InvalidArg(std::string msg)
	{
		return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, std::move(msg));
	}

	static grpc::Status Internal(std::string msg)
	{
		return grpc::Status(grpc::StatusCode::INTERNAL, std::move(msg));
	}

	static grpc::Status PreconditionFailed(std::string msg)
	{
		return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, std::move(msg));
	}

	static bool IsValidBucket(const std::string& bucket) noexcept
	{
		return !bucket.empty()
		    && bucket.front() != '.'
		    && bucket.find('/') == std::string::npos;
	}

	static bool IsValidName(const std::string& name) noexcept
	{
		const fs::path path(name);
		if (name.empty() || path.is_absolute() || name.back() == '/')
			return false;

		bool first = true;
		for (const auto& part : path) {
			const std::string component = part.string();
			if (component.empty() || component == "." || component == "..")
				return false;

			if (first && component == ObjectStore::kStagingDirectory)
				return false;

			first = false;
		}

		return true;
	}
}

ObjectStore::ObjectStore(const std::filesystem::path& root)
	: root_(root)
{
}

bool ObjectStore::IsValid() const noexcept
{
	std::error_code ec;
	return !root_.empty()
	    && fs::exists(root_, ec)
	    && fs::is_directory(root_, ec);
}

const std::filesystem::path& ObjectStore::GetRoot() const noexcept
{
	return root_;
}

std::tuple<bool, std::unique_ptr<PendingObject>, grpc::Status>
ObjectStore::BeginWrite(const WriteInit& init) noexcept
{
	const ObjectInfo& object = init.object();

	auto [ok_path, path, st_path] = ResolvePath(object.bucket(), object.name());
	if (!ok_path)
		return { false, nullptr, st_path };

	if (auto st = CheckPreconditions(path, init.preconditions()); !st.ok())
		return { false, nullptr, st };

	auto pending = std::make_unique<PendingObject>();
	pending->upload_id = NextUploadId();
	pending->requested = object;
	pending->preconditions = init.preconditions();
	pending->final_path = path;

	pending->hashing_enabled = init.has_hashtype() && (init.hashtype() != HASH_TYPE_UNSPECIFIED);
	pending->hash_type = pending->hashing_enabled ? init.hashtype() : HASH_TYPE_UNSPECIFIED;

	const fs::path staging = root_ / object.bucket() / kStagingDirectory;

	std::error_code ec;
	fs::create_directories(staging, ec);
	if (ec)
		return { false, nullptr, Internal(fmt::format("failed to create {}: {}", staging.string(), ec.message())) };

	pending->temp_path = staging / pending->upload_id;

	if (pending->hashing_enabled) {
		auto opt = MapHasherType(pending->hash_type);
		if (!opt)
			return { false, nullptr, InvalidArg("invalid hashtype") };

		pending->hashing = std::make_unique<HashingFileStream>(pending->temp_path, *opt);
	} else {
		pending->plain = std::make_unique<FileStream>(pending->temp_path);
	}

	if (auto err = pending->Open())
		return { false, nullptr, Internal("open failed: " + err->message) };

	spdlog::debug("upload {} started for {}", pending->upload_id, ObjectName(object));

	return { true, std::move(pending), grpc::Status::OK };
}

std::tuple<bool, ObjectInfo, grpc::Status> ObjectStore::Commit(PendingObject& pending, const Hash& expected) noexcept
{
	if (pending.committed)
		return { false, ObjectInfo{}, InvalidArg("upload already committed") };

	if (auto err = pending.Close())
		return { false, ObjectInfo{}, Internal("close failed: " + err->message) };

	if (pending.hashing_enabled) {
		const auto hash = pending.GetHash();
		if (!hash)
			return { false, ObjectInfo{}, Internal("failed to read server hash") };

		if (expected.data().size() != hash->size() ||
		    std::memcmp(expected.data().data(), hash->data(), hash->size()) != 0)
			return { false, ObjectInfo{}, grpc::Status(grpc::StatusCode::DATA_LOSS, "hash mismatch") };
	}

	// A competing upload may have landed since BeginWrite.
	std::lock_guard<std::mutex> lock(commit_mutex_);

	if (auto st = CheckPreconditions(pending.final_path, pending.preconditions); !st.ok())
		return { false, ObjectInfo{}, st };

	std::error_code ec;
	fs::create_directories(pending.final_path.parent_path(), ec);
	if (ec)
		return { false, ObjectInfo{}, Internal(fmt::format("failed to create {}: {}", pending.final_path.parent_path().string(), ec.message())) };

	fs::rename(pending.temp_path, pending.final_path, ec);
	if (ec)
		return { false, ObjectInfo{}, Internal(fmt::format("failed to commit {}: {}", ObjectName(pending.requested), ec.message())) };

	pending.committed = true;

	ObjectInfo info = MakeObjectInfoFrom(pending.final_path, pending.requested);
	if (const auto hash = pending.GetHash()) {
		info.mutable_hash()->set_hashtype(pending.hash_type);
		info.mutable_hash()->set_data(hash->data(), hash->size());
	}

	spdlog::debug("upload {} committed {} generation={}", pending.upload_id, ObjectName(info), info.generation());

	return { true, std::move(info), grpc::Status::OK };
}

std::optional<ObjectInfo> ObjectStore::Stat(const std::string& bucket, const std::string& name) const
{
	auto [ok, path, st] = ResolvePath(bucket, name);
	if (!ok || !GenerationOf(path))
		return std::nullopt;

	return MakeObjectInfoFrom(path, MakeObjectInfo(bucket, name));
}

std::tuple<bool, std::filesystem::path, grpc::Status>
ObjectStore::ResolvePath(const std::string& bucket, const std::string& name) const noexcept
{
	if (!IsValidBucket(bucket))
		return { false, fs::path{}, InvalidArg("invalid bucket name: '" + bucket + "'") };

	if (!IsValidName(name))
		return { false, fs::path{}, InvalidArg("invalid object name: '" + name + "'") };

	return { true, root_ / bucket / name, grpc::Status::OK };
}

grpc::Status ObjectStore::CheckPreconditions(const std::filesystem::path& path,
					     const WritePreconditions& preconditions) const noexcept
{
	const std::optional<int64_t> generation = GenerationOf(path);

	if (preconditions.has_if_generation_match()) {
		const int64_t expected = preconditions.if_generation_match();

		if (expected == 0 && generation)
			return PreconditionFailed(fmt::format("object already exists (generation {})", *generation));

		if (expected != 0 && (!generation || *generation != expected))
			return PreconditionFailed(fmt::format("generation does not match {}", expected));
	}

	if (preconditions.has_if_generation_not_match() && generation
	    && *generation == preconditions.if_generation_not_match())
		return PreconditionFailed(fmt::format("generation matches {}", *generation));

	return grpc::Status::OK;
}

std::string ObjectStore::NextUploadId()
{
	const auto now = std::chrono::system_clock::now().time_since_epoch();
	const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();

	return fmt::format("{:016x}-{}", ns, next_upload_id_.fetch_add(1, std::memory_order_relaxed));
}
