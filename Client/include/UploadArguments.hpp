#pragma once

#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "UploadConfig.hpp"
#include "WriteOptions.hpp"

struct Arguments {
        std::map<std::string, std::string> values;
        std::vector<std::string> sources;
};

// Parses the objupload command line with getopt_long. On failure the variant
// holds a message for the user.
std::pair<bool, std::variant<Arguments, std::string>> ParseArgument(int argc, char* argv[]);

std::pair<bool, std::variant<std::pair<UploadConfig, WriteOptions>, std::string>> MakeUploadConfig(const Arguments& args);
