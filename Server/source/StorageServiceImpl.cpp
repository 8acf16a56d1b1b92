#include "StorageServiceImpl.hpp"

#include <string>
#include <tuple>

#include <spdlog/spdlog.h>

#include "ObjectInfo.hpp"

#include "grpcpp/support/status.h"

namespace {
	static grpc::Status InvalidArg(std::string msg)
	{
		return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, std::move(msg));
	}

	static grpc::Status Internal(std::string msg)
	{
		return grpc::Status(grpc::StatusCode::INTERNAL, std::move(msg));
	}

	static bool HashLengthMatches(HashType t, size_t n)
	{
		switch (t) {
		case HASH_TYPE_SHA256: return n == 32;
		case HASH_TYPE_SHA512: return n == 64;
		case HASH_TYPE_UNSPECIFIED:
		default:
			return n == 0;
		}
	}
}

StorageServiceImpl::StorageServiceImpl(ObjectStore& store)
    : store_(store)
{
}

grpc::Status StorageServiceImpl::WriteObject(grpc::ServerContext* context,
                                             grpc::ServerReader<WriteObjectRequest>* reader,
                                             WriteObjectResponse* response)
{
    auto [ok_open, pending, st_open] = OpenObject(reader);
    if (!ok_open)
        return st_open;

    context->AddInitialMetadata(kUploadIdMetadataKey, pending->upload_id);
    reader->SendInitialMetadata();

    auto [ok_recv, finish, st_recv] = ReceiveChunks(context, reader, *pending);
    if (!ok_recv)
        return st_recv;

    if (auto st = CheckFinish(finish, *pending); !st.ok())
        return st;

    auto [ok_commit, object, st_commit] = store_.Commit(*pending, finish.hash());
    if (!ok_commit)
        return st_commit;

    *response->mutable_object() = std::move(object);

    return grpc::Status::OK;
}

std::tuple<bool, std::unique_ptr<PendingObject>, grpc::Status>
StorageServiceImpl::OpenObject(grpc::ServerReader<WriteObjectRequest>* reader) noexcept
{
    WriteObjectRequest first;
    if (!reader->Read(&first))
        return { false, nullptr, InvalidArg("empty request stream") };

    if (first.request_case() != WriteObjectRequest::kInit)
        return { false, nullptr, InvalidArg("first message must be init") };

    return store_.BeginWrite(first.init());
}

std::tuple<bool, WriteFinish, grpc::Status>
StorageServiceImpl::ReceiveChunks(grpc::ServerContext* context,
                                  grpc::ServerReader<WriteObjectRequest>* reader,
                                  PendingObject& pending) noexcept
{
    WriteObjectRequest req;
    while (reader->Read(&req)) {
        switch (req.request_case()) {
        case WriteObjectRequest::kChunk: {
            const WriteChunk& chunk = req.chunk();
            if (chunk.offset() != pending.GetReceived())
                return { false, WriteFinish{}, InvalidArg("chunk offset " + std::to_string(chunk.offset())
                                                           + " does not follow " + std::to_string(pending.GetReceived())) };

            if (auto err = pending.Write(chunk.data()))
                return { false, WriteFinish{}, Internal("write failed: " + err->message) };

            break;
        }

        case WriteObjectRequest::kFinish: {
            WriteObjectRequest extra;
            if (reader->Read(&extra))
                return { false, WriteFinish{}, InvalidArg("extra messages after finish are not allowed") };

            return { true, req.finish(), grpc::Status::OK };
        }

        case WriteObjectRequest::kInit:
            return { false, WriteFinish{}, InvalidArg("init must appear only as the first message") };

        case WriteObjectRequest::REQUEST_NOT_SET:
        default:
            return { false, WriteFinish{}, InvalidArg("invalid request") };
        }
    }

    if (context->IsCancelled())
        return { false, WriteFinish{}, grpc::Status(grpc::StatusCode::CANCELLED, "upload cancelled by client") };

    return { false, WriteFinish{}, InvalidArg("stream ended before finish") };
}

grpc::Status StorageServiceImpl::CheckFinish(const WriteFinish& finish, const PendingObject& pending) noexcept
{
    if (finish.size() != pending.GetReceived())
        return InvalidArg("finish.size " + std::to_string(finish.size()) + " does not match "
                          + std::to_string(pending.GetReceived()) + " received bytes");

    if (!pending.hashing_enabled)
        return grpc::Status::OK;

    if (!finish.has_hash())
        return InvalidArg("finish.hash is required when init.hashtype is set");

    const Hash& expected = finish.hash();
    if (expected.hashtype() != pending.hash_type)
        return InvalidArg("finish.hash.hashtype mismatch with init.hashtype");

    if (!HashLengthMatches(expected.hashtype(), static_cast<size_t>(expected.data().size())))
        return InvalidArg("finish.hash.data length does not match hashtype");

    return grpc::Status::OK;
}
