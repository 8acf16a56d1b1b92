#pragma once

#include "storage_service.grpc.pb.h"

#include <chrono>
#include <memory>
#include <tuple>

#include <grpcpp/grpcpp.h>

#include "StorageClient.hpp"

// StorageClient backed by the ObjectStorage.WriteObject client stream.
//
// Every session uses its own call. Options are applied in order, so a later
// option of the same kind wins. Unless a Checksum option says otherwise the
// bytes are digested with SHA-256 and the server has to confirm the digest.
//
// `call_timeout` is the deadline of a whole WriteObject call, from the init
// to the server's answer. Zero means no deadline.
class GrpcStorageClient final : public StorageClient
{
public:
    static constexpr std::chrono::milliseconds kDefaultCallTimeout = std::chrono::minutes(10);

public:
    explicit GrpcStorageClient(std::shared_ptr<grpc::Channel> channel,
                               std::chrono::milliseconds call_timeout = kDefaultCallTimeout);

public:
    std::tuple<bool, std::unique_ptr<WriteSession>, TransferError>
    OpenWriteSession(const ObjectInfo& object, const WriteOptions& options) noexcept override;

private:
    std::unique_ptr<ObjectStorage::Stub> stub_;
    std::chrono::milliseconds call_timeout_;
};

TransferError MakeGrpcError(const grpc::Status& st, const char* context);
