#include "GrpcStorageClient.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <fmt/core.h>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "Hasher.hpp"
#include "ObjectInfo.hpp"
#include "storage_service.pb.h"
#include "hash.pb.h"

TransferError MakeGrpcError(const grpc::Status& st, const char* context)
{
    const int code = static_cast<int>(st.error_code());
    std::string message = fmt::format("{}: {}", context, st.error_message());

    switch (st.error_code()) {
    case grpc::StatusCode::FAILED_PRECONDITION:
        return TransferError::PreconditionFailed(code, std::move(message));
    case grpc::StatusCode::DEADLINE_EXCEEDED:
        return TransferError{ ErrorKind::Timeout, code, std::move(message) };
    case grpc::StatusCode::CANCELLED:
        return TransferError{ ErrorKind::Cancelled, code, std::move(message) };
    default:
        return TransferError::Backend(code, std::move(message));
    }
}

namespace {
    std::optional<Hasher::Type> MapHashTypeOptional(HashType hashtype)
    {
        switch (hashtype) {
        case HASH_TYPE_SHA256: return Hasher::Type::SHA256;
        case HASH_TYPE_SHA512: return Hasher::Type::SHA512;
        case HASH_TYPE_UNSPECIFIED:
        default:
            return std::nullopt;
        }
    }

    TransferError MakeStreamErr(const grpc::Status& st, const char* context)
    {
        if (st.ok())
            return TransferError::Backend(static_cast<int>(grpc::StatusCode::UNKNOWN),
                                          fmt::format("{}: stream closed by server", context));

        return MakeGrpcError(st, context);
    }

    // Everything one WriteObject call owns. The sink, the completion handle
    // and the session share it; the finisher thread only borrows it and is
    // joined before it goes away.
    struct WriteState {
        ~WriteState();

        grpc::Status FinishNow();
        void StartFinish();
        bool IsFinishing() const noexcept;

        grpc::ClientContext ctx;
        WriteObjectResponse response;
        std::unique_ptr<grpc::ClientWriter<WriteObjectRequest>> writer;

        std::string upload_id;
        std::string object_name;

        HashType hashtype = HASH_TYPE_UNSPECIFIED;
        std::optional<Hasher> hasher;
        std::optional<std::vector<uint8_t>> digest;
        std::uint64_t offset = 0;

        bool released = false;
        bool finished = false;
        grpc::Status status;

        std::promise<grpc::Status> promise;
        std::shared_future<grpc::Status> result;
        std::thread finisher;
    };

    WriteState::~WriteState()
    {
        if (finisher.joinable()) {
            if (result.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
                ctx.TryCancel();
            finisher.join();
            return;
        }

        if (writer && !finished) {
            ctx.TryCancel();
            (void)FinishNow();
        }
    }

    grpc::Status WriteState::FinishNow()
    {
        if (finished)
            return status;

        finished = true;
        status = writer->Finish();

        return status;
    }

    void WriteState::StartFinish()
    {
        finished = true;
        result = promise.get_future().share();
        finisher = std::thread([this] {
            promise.set_value(writer->Finish());
        });
    }

    bool WriteState::IsFinishing() const noexcept
    {
        return finisher.joinable();
    }

    class GrpcWritableSink final : public WritableSink
    {
    public:
        explicit GrpcWritableSink(std::shared_ptr<WriteState> state)
            : state_(std::move(state)) { }

    public:
        std::optional<TransferError> Write(std::string_view data) noexcept override
        {
            if (state_->released)
                return TransferError::InvalidArgument("write to a released sink");

            if (data.empty())
                return std::nullopt;

            if (state_->hasher) {
                if (auto herr = state_->hasher->Update(data))
                    return TransferError::Internal("failed to hash chunk: " + herr->message);
            }

            WriteObjectRequest req;
            WriteChunk* chunk = req.mutable_chunk();
            chunk->set_data(data.data(), data.size());
            chunk->set_offset(state_->offset);

            if (!state_->writer->Write(req)) {
                state_->released = true;
                return MakeStreamErr(state_->FinishNow(), "write chunk");
            }

            state_->offset += data.size();

            return std::nullopt;
        }

        std::optional<TransferError> Close() noexcept override
        {
            if (state_->released)
                return std::nullopt;

            state_->released = true;

            WriteObjectRequest req;
            WriteFinish* fin = req.mutable_finish();
            fin->set_size(state_->offset);

            if (state_->hasher) {
                auto [ok, digest, herr] = state_->hasher->Finalize();
                if (!ok) {
                    state_->ctx.TryCancel();
                    (void)state_->FinishNow();
                    return TransferError::Internal("failed to finalize hash: " + herr.message);
                }

                fin->mutable_hash()->set_hashtype(state_->hashtype);
                fin->mutable_hash()->set_data(digest.data(), digest.size());
                state_->digest = std::move(digest);
            }

            if (!state_->writer->Write(req))
                return MakeStreamErr(state_->FinishNow(), "write finish");

            if (!state_->writer->WritesDone())
                return MakeStreamErr(state_->FinishNow(), "half-close");

            state_->StartFinish();

            return std::nullopt;
        }

        void Abort() noexcept override
        {
            if (state_->released)
                return;

            state_->released = true;
            state_->ctx.TryCancel();

            const grpc::Status st = state_->FinishNow();
            spdlog::debug("aborted upload {} of {}: code={} {}", state_->upload_id,
                          state_->object_name, static_cast<int>(st.error_code()), st.error_message());
        }

        bool IsOpen() const noexcept override
        {
            return !state_->released;
        }

    private:
        std::shared_ptr<WriteState> state_;
    };

    class GrpcCompletionHandle final : public CompletionHandle
    {
    public:
        explicit GrpcCompletionHandle(std::shared_ptr<WriteState> state)
            : state_(std::move(state)) { }

    public:
        std::tuple<bool, ObjectInfo, TransferError> Await(std::chrono::milliseconds timeout) noexcept override
        {
            if (!state_->IsFinishing()) {
                if (state_->finished)
                    return { false, ObjectInfo{}, MakeStreamErr(state_->status, "finalize") };

                return { false, ObjectInfo{}, TransferError::InvalidArgument("write session has not been closed") };
            }

            if (state_->result.wait_for(timeout) != std::future_status::ready) {
                state_->ctx.TryCancel();
                return { false, ObjectInfo{}, TransferError::Timeout(
                    fmt::format("object {} was not confirmed within {}ms", state_->object_name, timeout.count())) };
            }

            const grpc::Status st = state_->result.get();
            if (!st.ok())
                return { false, ObjectInfo{}, MakeGrpcError(st, "finalize") };

            const ObjectInfo& object = state_->response.object();
            if (state_->digest) {
                const std::string& server_hash = object.hash().data();
                if (object.hash().hashtype() != state_->hashtype ||
                    server_hash.size() != state_->digest->size() ||
                    !std::equal(server_hash.begin(), server_hash.end(), state_->digest->begin(),
                                [](char a, uint8_t b) { return static_cast<uint8_t>(a) == b; }))
                    return { false, ObjectInfo{}, TransferError::Backend(
                        static_cast<int>(grpc::StatusCode::DATA_LOSS), "server returned hash mismatch") };
            }

            return { true, object, TransferError{} };
        }

    private:
        std::shared_ptr<WriteState> state_;
    };

    class GrpcWriteSession final : public WriteSession
    {
    public:
        GrpcWriteSession(ObjectStorage::Stub& stub, WriteInit init, std::chrono::milliseconds call_timeout)
            : stub_(stub)
            , init_(std::move(init))
            , call_timeout_(call_timeout)
            , state_(std::make_shared<WriteState>())
        {
            state_->object_name = ObjectName(init_.object());
            state_->hashtype = init_.has_hashtype() ? init_.hashtype() : HASH_TYPE_UNSPECIFIED;
        }

    public:
        std::tuple<bool, std::unique_ptr<WritableSink>, TransferError> Open() noexcept override
        {
            if (state_->writer)
                return { false, nullptr, TransferError::InvalidArgument("write session is already open") };

            if (const auto type = MapHashTypeOptional(state_->hashtype)) {
                state_->hasher.emplace(*type);
                if (auto herr = state_->hasher->Initialize())
                    return { false, nullptr, TransferError::Internal("failed to initialize hasher: " + herr->message) };
            }

            if (call_timeout_.count() > 0)
                state_->ctx.set_deadline(std::chrono::system_clock::now() + call_timeout_);

            state_->writer = stub_.WriteObject(&state_->ctx, &state_->response);
            if (!state_->writer)
                return { false, nullptr, TransferError::Internal("failed to create ClientWriter") };

            WriteObjectRequest req;
            *req.mutable_init() = init_;

            if (!state_->writer->Write(req))
                return { false, nullptr, MakeStreamErr(state_->FinishNow(), "write init") };

            // The server only answers with initial metadata once the init has
            // passed validation and preconditions; otherwise the call is over.
            state_->writer->WaitForInitialMetadata();

            const auto& metadata = state_->ctx.GetServerInitialMetadata();
            const auto it = metadata.find(kUploadIdMetadataKey);
            if (it == metadata.end())
                return { false, nullptr, MakeStreamErr(state_->FinishNow(), "open") };

            state_->upload_id.assign(it->second.data(), it->second.size());
            spdlog::debug("upload {} accepted for {}", state_->upload_id, state_->object_name);

            return { true, std::make_unique<GrpcWritableSink>(state_), TransferError{} };
        }

        std::unique_ptr<CompletionHandle> GetResult() noexcept override
        {
            return std::make_unique<GrpcCompletionHandle>(state_);
        }

    private:
        ObjectStorage::Stub& stub_;
        const WriteInit init_;
        const std::chrono::milliseconds call_timeout_;
        std::shared_ptr<WriteState> state_;
    };

    std::optional<TransferError> ApplyOptions(WriteInit& init, const WriteOptions& options)
    {
        WritePreconditions* preconditions = init.mutable_preconditions();

        for (const WriteOption& option : options.GetOptions()) {
            switch (option.GetKind()) {
            case WriteOption::Kind::DoesNotExist:
                preconditions->set_if_generation_match(0);
                break;
            case WriteOption::Kind::IfGenerationMatch:
                preconditions->set_if_generation_match(option.GetGeneration());
                break;
            case WriteOption::Kind::IfGenerationNotMatch:
                preconditions->set_if_generation_not_match(option.GetGeneration());
                break;
            case WriteOption::Kind::Checksum:
                if (option.GetHashType() != HASH_TYPE_UNSPECIFIED && !MapHashTypeOptional(option.GetHashType()))
                    return TransferError::InvalidArgument("unsupported checksum: " + option.ToString());
                init.set_hashtype(option.GetHashType());
                break;
            case WriteOption::Kind::ContentType:
                init.mutable_object()->set_content_type(option.GetContentType());
                break;
            }
        }

        return std::nullopt;
    }
}

GrpcStorageClient::GrpcStorageClient(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds call_timeout)
    : stub_(ObjectStorage::NewStub(std::move(channel)))
    , call_timeout_(call_timeout)
{
}

std::tuple<bool, std::unique_ptr<WriteSession>, TransferError>
GrpcStorageClient::OpenWriteSession(const ObjectInfo& object, const WriteOptions& options) noexcept
{
    if (!stub_)
        return { false, nullptr, TransferError::Internal("stub not initialized") };

    if (object.bucket().empty() || object.name().empty())
        return { false, nullptr, TransferError::InvalidArgument("object bucket/name is empty") };

    WriteInit init;
    *init.mutable_object() = object;
    init.set_hashtype(HASH_TYPE_SHA256);

    if (auto err = ApplyOptions(init, options))
        return { false, nullptr, *err };

    return { true, std::make_unique<GrpcWriteSession>(*stub_, std::move(init), call_timeout_), TransferError{} };
}
