#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <grpcpp/support/server_interceptor.h>
#include <grpcpp/support/interceptor.h>
#include <grpcpp/grpcpp.h>

#include <spdlog/spdlog.h>

#include "storage_service.pb.h"

#include "ObjectInfo.hpp"

// One log line per WriteObject call, written when the status goes out:
// failures at warn level, the rest at info.
class UploadLogInterceptor final : public grpc::experimental::Interceptor {
public:
	explicit UploadLogInterceptor(grpc::experimental::ServerRpcInfo *info,
				      std::shared_ptr<spdlog::logger> logger)
		: info_(info)
		, logger_(std::move(logger))
		, start_(std::chrono::steady_clock::now()) { }

public:
	void Intercept(grpc::experimental::InterceptorBatchMethods *methods) override {
		using grpc::experimental::InterceptionHookPoints;

		if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::POST_RECV_MESSAGE))
			Account(static_cast<const WriteObjectRequest*>(methods->GetRecvMessage()));

		if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::PRE_SEND_INITIAL_METADATA)) {
			const auto* metadata = methods->GetSendInitialMetadata();
			if (metadata) {
				const auto it = metadata->find(kUploadIdMetadataKey);
				if (it != metadata->end())
					upload_id_ = it->second;
			}
		}

		if (methods->QueryInterceptionHookPoint(InterceptionHookPoints::PRE_SEND_STATUS))
			Report(methods->GetSendStatus());

		methods->Proceed();
	}

private:
	void Account(const WriteObjectRequest* request) {
		if (!request)
			return;

		switch (request->request_case()) {
		case WriteObjectRequest::kInit:
			object_ = ObjectName(request->init().object());
			break;
		case WriteObjectRequest::kChunk:
			chunks_++;
			bytes_ += request->chunk().data().size();
			break;
		default:
			break;
		}
	}

	void Report(const grpc::Status& st) const {
		if (!logger_)
			return;

		const auto elapsed = std::chrono::steady_clock::now() - start_;
		const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
		const bool cancelled = info_ && info_->server_context() && info_->server_context()->IsCancelled();

		logger_->log(st.ok() ? spdlog::level::info : spdlog::level::warn,
			     "[write] upload={} object={} peer={} code={} message=\"{}\" cancelled={} chunks={} bytes={} latency_ms={}",
			     upload_id_.empty() ? "-" : upload_id_, object_.empty() ? "-" : object_,
			     info_ && info_->server_context() ? info_->server_context()->peer() : "",
			     static_cast<int>(st.error_code()), st.error_message(), cancelled, chunks_, bytes_, ms);
	}

private:
	grpc::experimental::ServerRpcInfo *info_;
	std::shared_ptr<spdlog::logger> logger_;

	std::chrono::steady_clock::time_point start_;
	std::string upload_id_;
	std::string object_;
	std::uint64_t chunks_ = 0;
	std::uint64_t bytes_ = 0;
};

class UploadLogInterceptorFactory final
	: public grpc::experimental::ServerInterceptorFactoryInterface {
public:
	explicit UploadLogInterceptorFactory(std::shared_ptr<spdlog::logger> logger)
		: logger_(std::move(logger)) { }

	grpc::experimental::Interceptor* CreateServerInterceptor(
		grpc::experimental::ServerRpcInfo *info
	) override
	{
		if (!info || std::string(info->method()) != "/ObjectStorage/WriteObject")
			return nullptr;

		return new UploadLogInterceptor(info, logger_);
	}

private:
	std::shared_ptr<spdlog::logger> logger_;
};
