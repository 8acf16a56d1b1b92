#include <chrono>
#include <filesystem>
#include <iostream>
#include <variant>
#include <string>

#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>

#include "GrpcStorageClient.hpp"
#include "ObjectInfo.hpp"
#include "UploadArguments.hpp"
#include "UploadTask.hpp"

void ShowArgument(const Arguments& args)
{
	for (const auto &[name, value]: args.values)
	    spdlog::info("{}: {}", name, value);

	for (const auto& source : args.sources)
	    spdlog::info("source: {}", source);
}

int main(int argc, char* argv[])
{
	const auto &[success, result] = ParseArgument(argc, argv);
	if (!success) {
                spdlog::error("failed to ParseArgument(): {}", std::get<std::string>(result));
                return 1;
        }

        const Arguments& args = std::get<Arguments>(result);
        spdlog::set_level(spdlog::level::from_str(args.values.at("loglevel")));
        ShowArgument(args);

        const auto &[config_ok, config_result] = MakeUploadConfig(args);
        if (!config_ok) {
                spdlog::error("failed to MakeUploadConfig(): {}", std::get<std::string>(config_result));
                return 1;
        }

        const auto& [config, options] = std::get<std::pair<UploadConfig, WriteOptions>>(config_result);

        const std::string target = fmt::format("{}:{}", args.values.at("host"), args.values.at("service"));
        std::shared_ptr<grpc::Channel> channel = grpc::CreateChannel(target, grpc::InsecureChannelCredentials());
        spdlog::info("channel opened at: {}", target);

        std::chrono::milliseconds call_timeout = GrpcStorageClient::kDefaultCallTimeout;
        if (args.values.count("call-timeout")) {
                try {
                        call_timeout = std::chrono::milliseconds(std::stoll(args.values.at("call-timeout")));
                }
                catch (std::exception& e) {
                        spdlog::error("invalid call timeout: {}", e.what());
                        return 1;
                }
        }

        GrpcStorageClient client(channel, call_timeout);

        int failed = 0;
        for (const std::string& source : args.sources) {
                const bool from_stdin = (source == "-");

                std::string name;
                if (from_stdin)
                        name = args.values.count("name") ? args.values.at("name") : "stdin";
                else
                        name = std::filesystem::path(source).filename().string();

                UploadTask task(client,
                                MakeObjectInfo(config.bucket, config.prefix + name),
                                from_stdin ? DataSource::FromStream(std::cin) : DataSource::FromPath(source),
                                config, options);

                const UploadResult upload = task.Execute();
                switch (upload.GetStatus()) {
                case TransferStatus::Success:
                        spdlog::info("uploaded {}:\n{}", source, ObjectInfoToString(*upload.GetUploadedObject()));
                        break;
                case TransferStatus::Skipped:
                        spdlog::info("skipped {}: {}", source, upload.GetError()->message);
                        break;
                case TransferStatus::FailedToFinish:
                        spdlog::error("failed to upload {}: {}", source, upload.GetError()->ToString());
                        failed++;
                        break;
                }
        }

        spdlog::info("{} of {} upload(s) failed", failed, args.sources.size());

        return failed == 0 ? 0 : 1;
}
