#include <memory>
#include <variant>
#include <string>
#include <vector>
#include <map>

#include <getopt.h>

#include <grpcpp/support/server_interceptor.h>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "ObjectStore.hpp"
#include "StorageServiceImpl.hpp"
#include "UploadLogInterceptor.hpp"

using ArgList = std::map<std::string, std::string>;

std::pair<bool, std::variant<ArgList, std::string>> ParseArgument(int argc, char* argv[])
{
    ArgList arglist;

    const struct option options[] = {
            { "loglevel", required_argument, nullptr, 'l' },
            { "root-dir", required_argument, nullptr, 'r' },
            { nullptr, 0, nullptr, 0 }
    };

    try {
        int optidx;
        for (int opt; (opt = getopt_long(argc, argv, "l:r:", options, &optidx)) != -1; ) {
            switch (opt) {
            case 'l':
                arglist["loglevel"] = optarg;
                break;
            case 'r':
                arglist["root-dir"] = optarg;
                break;
            case ':':
                return { false, fmt::format("missing argument: {}", static_cast<char>(optopt)) };
            case '?':
                return { false, fmt::format("invalid argument: {}", static_cast<char>(optopt)) };
            }
        }
    }
    catch (std::exception& e) {
        return { false, fmt::format("invalid argument: {}", e.what()) };
    }

    if (argc - optind < 2)
        return { false, fmt::format("usage: {} [--loglevel <level>] [--root-dir <directory>] <host> <service>", *argv) };

    argv += optind;

    arglist["host"] = *argv++;
    arglist["service"] = *argv++;

    if (arglist.find("root-dir") == arglist.end())
        arglist["root-dir"] = ".";

    if (arglist.find("loglevel") == arglist.end())
        arglist["loglevel"] = "info";

    return { true, arglist };
}

void ShowArgument(const ArgList& arglist)
{
    for (const auto &[name, value]: arglist)
	    spdlog::info("{}: {}", name, value);
}

int main(int argc, char* argv[])
{
    const auto &[success, result] = ParseArgument(argc, argv);
    if (!success) {
        spdlog::error("failed to ParseArgument(): {}", std::get<std::string>(result));
        return 1;
    }

    const ArgList& arglist = std::get<ArgList>(result);
    spdlog::set_level(spdlog::level::from_str(arglist.at("loglevel")));
    ShowArgument(arglist);

    ObjectStore store(arglist.at("root-dir"));
    if (!store.IsValid()) {
        spdlog::error("failed to create object store: invalid root directory {}", arglist.at("root-dir"));
        return 1;
    }

    StorageServiceImpl service(store);
    spdlog::info("registered service(s): ObjectStorage");

    const std::string address = fmt::format("{}:{}", arglist.at("host"), arglist.at("service"));

    std::vector<std::unique_ptr<grpc::experimental::ServerInterceptorFactoryInterface>> interceptors;
    interceptors.push_back(std::make_unique<UploadLogInterceptorFactory>(spdlog::stdout_color_mt("grpc")));

    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    builder.experimental().SetInterceptorCreators(std::move(interceptors));

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        spdlog::error("failed to start server on {}", address);
        return 1;
    }
    spdlog::info("server started: listening on {}", address);

    server->Wait();

    spdlog::info("server stopped");

    return 0;
}
