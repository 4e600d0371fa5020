#pragma once

#include "cli/Parser.hpp"
#include "config/Config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ci::cli {

struct Invocation {
    bool help = false;
    config::Config config;
};

const OptionSpec& optionSpec();

std::string usage(std::string_view program);

// `args` excludes argv[0]. A --config file is loaded first and the remaining
// options override it. Throws UsageError or config::ConfigError.
Invocation parseCommandLine(const std::vector<std::string>& args);

}
