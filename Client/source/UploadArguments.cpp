#include "UploadArguments.hpp"

#include <chrono>
#include <exception>

#include <getopt.h>

#include <fmt/core.h>

std::pair<bool, std::variant<Arguments, std::string>> ParseArgument(int argc, char* argv[])
{
        Arguments args;

        const struct option options[] = {
                { "loglevel",            required_argument, nullptr, 'l' },
                { "bucket",              required_argument, nullptr, 'b' },
                { "prefix",              required_argument, nullptr, 'p' },
                { "name",                required_argument, nullptr, 'n' },
                { "content-type",        required_argument, nullptr, 'c' },
                { "hash",                required_argument, nullptr, 'H' },
                { "timeout",             required_argument, nullptr, 't' },
                { "if-generation-match", required_argument, nullptr, 'g' },
                { "if-not-exists",       no_argument,       nullptr, 'x' },
                { "skip-if-exists",      no_argument,       nullptr, 's' },
                { "call-timeout",        required_argument, nullptr, 'T' },
                { nullptr, 0, nullptr, 0 }
        };

        try {
                int optidx;
                for (int opt; (opt = getopt_long(argc, argv, ":l:b:p:n:c:H:t:T:g:xs", options, &optidx)) != -1; ) {
                        switch (opt) {
                        case 'l': args.values["loglevel"] = optarg; break;
                        case 'b': args.values["bucket"] = optarg; break;
                        case 'p': args.values["prefix"] = optarg; break;
                        case 'n': args.values["name"] = optarg; break;
                        case 'c': args.values["content-type"] = optarg; break;
                        case 'H': args.values["hash"] = optarg; break;
                        case 't': args.values["timeout"] = optarg; break;
                        case 'T': args.values["call-timeout"] = optarg; break;
                        case 'g': args.values["if-generation-match"] = optarg; break;
                        case 'x': args.values["if-not-exists"] = "true"; break;
                        case 's': args.values["skip-if-exists"] = "true"; break;
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

        if (argc - optind < 3)
                return { false, fmt::format("usage: {} [options] --bucket <bucket> <host> <service> <source|->...", *argv) };

        argv += optind;
        argc -= optind;

        args.values["host"] = *argv++;
        args.values["service"] = *argv++;
        argc -= 2;

        for (; argc > 0; argc--)
                args.sources.emplace_back(*argv++);

        if (args.values.find("bucket") == args.values.end())
                return { false, "--bucket is required" };

        if (args.values.find("loglevel") == args.values.end())
                args.values["loglevel"] = "info";

        return { true, args };
}

std::pair<bool, std::variant<std::pair<UploadConfig, WriteOptions>, std::string>> MakeUploadConfig(const Arguments& args)
{
        UploadConfig config;
        WriteOptions options;

        const auto& values = args.values;
        const auto has = [&values](const char* key) { return values.find(key) != values.end(); };

        config.bucket = values.at("bucket");
        if (has("prefix"))
                config.prefix = values.at("prefix");

        config.skip_if_exists = has("skip-if-exists");

        try {
                if (has("timeout"))
                        config.finalize_timeout = std::chrono::milliseconds(std::stoll(values.at("timeout")));

                if (has("if-generation-match"))
                        options.Add(WriteOption::IfGenerationMatch(std::stoll(values.at("if-generation-match"))));
        }
        catch (std::exception& e) {
                return { false, fmt::format("invalid number: {}", e.what()) };
        }

        if (has("if-not-exists"))
                options.Add(WriteOption::DoesNotExist());

        if (has("content-type"))
                options.Add(WriteOption::ContentType(values.at("content-type")));

        if (has("hash")) {
                const std::string& hash = values.at("hash");
                if (hash == "sha256")
                        options.Add(WriteOption::Checksum(HASH_TYPE_SHA256));
                else if (hash == "sha512")
                        options.Add(WriteOption::Checksum(HASH_TYPE_SHA512));
                else if (hash == "none")
                        options.Add(WriteOption::Checksum(HASH_TYPE_UNSPECIFIED));
                else
                        return { false, fmt::format("unknown hash: {}", hash) };
        }

        return { true, std::make_pair(std::move(config), std::move(options)) };
}
