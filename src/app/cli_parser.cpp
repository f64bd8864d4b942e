#include "cli_parser.hpp"
#include <algorithm>
#include <system_error>
#include <vector>
#include "core/config/timeout_spec.hpp"

namespace forge::app::cli {

    using namespace forge::core::errors;
    using forge::protocol::ExecutionRequest;

    namespace {

        constexpr std::size_t kMinIdeaLength = 10;

        const std::vector<std::string> kValidModels = {
            "opus", "sonnet", "haiku",
            "claude-3-opus-20240229", "claude-3-sonnet-20240229", "claude-3-haiku-20240307"};

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> idea;
            std::optional<std::string> model;
            std::optional<std::string> timeout;
            std::optional<std::string> agents;
            std::optional<std::string> output_dir;
            std::optional<std::string> config_file;
            std::optional<std::string> log_file;
            std::vector<std::string> vars;
            bool keep_container = false;
            bool no_cache = false;
            bool verbose = false;
        };

        std::string trim(const std::string& value) {
            const auto first = value.find_first_not_of(" \t");
            if (first == std::string::npos) return "";
            const auto last = value.find_last_not_of(" \t");
            return value.substr(first, last - first + 1);
        }

        std::vector<std::string> split_agents(const std::string& text) {
            std::vector<std::string> agents;
            std::size_t start = 0;
            while (start <= text.size()) {
                const auto comma = text.find(',', start);
                const auto end = comma == std::string::npos ? text.size() : comma;
                const std::string agent = trim(text.substr(start, end - start));
                if (!agent.empty()) agents.push_back(agent);
                if (comma == std::string::npos) break;
                start = comma + 1;
            }
            return agents;
        }

        Result<std::filesystem::path> existing_directory(const std::string& text, const std::string& flag) {
            std::filesystem::path p(text);
            std::error_code ec;
            const bool is_dir = std::filesystem::is_directory(p, ec);
            if (ec || !is_dir) {
                return ForgeError{ErrorCategory::Input, flag + " does not exist or is not a directory: " + text, "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, ec);
            if (ec) {
                return ForgeError{ErrorCategory::Input, "Failed to canonicalize " + flag + ": " + text, "invalid_path"};
            }
            return canonical_path;
        }

        Result<std::filesystem::path> existing_file(const std::string& text, const std::string& flag) {
            std::error_code ec;
            const bool is_file = std::filesystem::is_regular_file(text, ec);
            if (ec || !is_file) {
                return ForgeError{ErrorCategory::Input, flag + " does not exist or is not a file: " + text, "invalid_path"};
            }
            return std::filesystem::path(text);
        }

        ForgeError missing_value(const std::string& flag) {
            return ForgeError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
        }

    } // namespace

    std::string usage() {
        return "Usage:\n"
               "  forge_cli run <idea> [--model M] [--timeout T] [--agents a,b] [--keep-container]\n"
               "                       [--no-cache] [--output-dir DIR] [--config FILE]\n"
               "                       [--log-file FILE] [--var KEY=VALUE] [--verbose]\n"
               "  forge_cli doctor [--output-dir DIR] [--config FILE] [--verbose]\n";
    }

    Result<CliInvocation> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ForgeError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        CliInvocation invocation;
        std::string command = argv[1];
        if (command == "run") {
            invocation.command = Command::Run;
        } else if (command == "doctor") {
            invocation.command = Command::Doctor;
        } else if (command == "help" || command == "--help" || command == "-h") {
            invocation.command = Command::Help;
            return invocation;
        } else {
            return ForgeError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            auto take = [&](std::optional<std::string>& slot) -> bool {
                if (i + 1 >= args.size()) return false;
                slot = args[++i];
                return true;
            };

            if (arg == "--model" || arg == "-m") {
                if (!take(raw.model)) return missing_value(arg);
            } else if (arg == "--timeout" || arg == "-t") {
                if (!take(raw.timeout)) return missing_value(arg);
            } else if (arg == "--agents" || arg == "-a") {
                if (!take(raw.agents)) return missing_value(arg);
            } else if (arg == "--output-dir" || arg == "-o") {
                if (!take(raw.output_dir)) return missing_value(arg);
            } else if (arg == "--config") {
                if (!take(raw.config_file)) return missing_value(arg);
            } else if (arg == "--log-file") {
                if (!take(raw.log_file)) return missing_value(arg);
            } else if (arg == "--var") {
                if (i + 1 >= args.size()) return missing_value(arg);
                raw.vars.push_back(args[++i]);
            } else if (arg == "--keep-container") {
                raw.keep_container = true;
            } else if (arg == "--no-cache") {
                raw.no_cache = true;
            } else if (arg == "--verbose" || arg == "-v") {
                raw.verbose = true;
            } else if (!arg.empty() && arg[0] == '-') {
                return ForgeError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument", usage()};
            } else if (!raw.idea.has_value()) {
                raw.idea = arg;
            } else {
                return ForgeError{ErrorCategory::Input, "Unexpected argument: " + arg, "unexpected_argument",
                                  "Quote the idea so it is passed as one argument."};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        invocation.verbose = raw.verbose;
        if (raw.config_file) {
            auto config = existing_file(*raw.config_file, "--config");
            if (is_error(config)) return get_error(config);
            invocation.config_file = get_value(config);
        }
        if (raw.log_file) {
            invocation.log_file = std::filesystem::path(*raw.log_file);
        }

        std::optional<std::filesystem::path> output_dir;
        if (raw.output_dir) {
            auto dir = existing_directory(*raw.output_dir, "--output-dir");
            if (is_error(dir)) return get_error(dir);
            output_dir = get_value(dir);
        }

        if (invocation.command == Command::Doctor) {
            if (raw.idea || raw.model || raw.timeout || raw.agents || !raw.vars.empty() ||
                raw.keep_container || raw.no_cache) {
                return ForgeError{ErrorCategory::Input, "doctor accepts only --output-dir, --config, --log-file and --verbose.",
                                  "unexpected_argument", usage()};
            }
            invocation.output_dir = output_dir;
            return invocation;
        }

        ExecutionRequest req;
        req.verbose = raw.verbose;
        req.keep_container = raw.keep_container;
        req.force_rebuild = raw.no_cache;
        if (output_dir) req.output_base_dir = *output_dir;

        if (!raw.idea.has_value() || trim(*raw.idea).empty()) {
            return ForgeError{ErrorCategory::Input, "Project idea cannot be empty.", "missing_idea",
                              "Usage: forge_cli run \"<idea>\""};
        }
        if (trim(*raw.idea).size() < kMinIdeaLength) {
            return ForgeError{ErrorCategory::Input, "Project idea should be at least 10 characters.", "idea_too_short",
                              "Describe the project in a short sentence."};
        }
        req.idea = trim(*raw.idea);

        if (raw.model) {
            if (std::find(kValidModels.begin(), kValidModels.end(), *raw.model) == kValidModels.end()) {
                return ForgeError{ErrorCategory::Input, "Invalid model: " + *raw.model, "invalid_model",
                                  "Choose from: opus, sonnet, haiku."};
            }
            req.model = *raw.model;
        }

        if (raw.timeout) {
            auto timeout = forge::core::config::parse_timeout(*raw.timeout);
            if (is_error(timeout)) return get_error(timeout);
            req.timeout = get_value(timeout);
        }

        if (raw.agents && trim(*raw.agents) != "auto") {
            req.forced_agents = split_agents(*raw.agents);
        }

        for (const auto& var : raw.vars) {
            const auto eq = var.find('=');
            if (eq == std::string::npos || eq == 0) {
                return ForgeError{ErrorCategory::Input, "Invalid --var: " + var, "invalid_template_var",
                                  "Use --var KEY=VALUE."};
            }
            req.template_vars[var.substr(0, eq)] = var.substr(eq + 1);
        }

        invocation.request = std::move(req);
        return invocation;
    }

} // namespace forge::app::cli
