#pragma once

#include "storage_service.grpc.pb.h"
#include "storage_service.pb.h"
#include "object.pb.h"

#include <tuple>

#include "ObjectStore.hpp"
#include "PendingObject.hpp"

class StorageServiceImpl final : public ObjectStorage::Service
{
public:
        explicit StorageServiceImpl(ObjectStore& store);

private:
        grpc::Status WriteObject(grpc::ServerContext* context, grpc::ServerReader<WriteObjectRequest>* reader, WriteObjectResponse* response) override;

private:
	std::tuple<bool, std::unique_ptr<PendingObject>, grpc::Status> OpenObject(grpc::ServerReader<WriteObjectRequest>* reader) noexcept;
	std::tuple<bool, WriteFinish, grpc::Status> ReceiveChunks(grpc::ServerContext* context, grpc::ServerReader<WriteObjectRequest>* reader, PendingObject& pending) noexcept;
	grpc::Status CheckFinish(const WriteFinish& finish, const PendingObject& pending) noexcept;

private:
        ObjectStore& store_;
};
