#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/forge_errors.hpp"
#include "protocol/execution_request.hpp"

namespace forge::app::cli {

    enum class Command {
        Run,
        Doctor,
        Help
    };

    struct CliInvocation {
        Command command = Command::Help;
        forge::protocol::ExecutionRequest request;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> log_file;
        std::optional<std::filesystem::path> output_dir;  // doctor only
        bool verbose = false;
    };

    forge::core::errors::Result<CliInvocation> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
