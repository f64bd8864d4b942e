#include "orchestration/session_script.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace forge::orchestration {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

namespace {

core::errors::Status write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return ForgeError{ErrorCategory::Filesystem,
                          "Unable to open " + path.string() + " for writing.",
                          "session_write_failed",
                          "Check permissions on the output directory."};
    }
    out << text;
    if (!out.good()) {
        return ForgeError{ErrorCategory::Filesystem, "Unable to write " + path.string(),
                          "session_write_failed",
                          "Check free disk space and permissions on the output directory."};
    }
    return core::errors::ok();
}

}  // namespace

std::string build_prompt(const std::string& idea, const std::vector<std::string>& agents) {
    std::ostringstream prompt;
    prompt << "Please create a complete software project based on this idea: \"" << idea
           << "\"\n\n"
           << "Instructions:\n"
           << "1. Analyze the requirements and create a full project structure\n"
           << "2. Generate all necessary files including source code, configuration, "
              "and documentation\n"
           << "3. Follow established conventions for the chosen technology stack\n"
           << "4. Create a README with setup and usage instructions\n"
           << "5. Include any necessary build scripts, package files, or configuration\n"
           << "6. Make sure the project is ready to run with minimal setup\n";
    if (!agents.empty()) {
        prompt << "\nUse these specialist agents where they apply:";
        for (const auto& agent : agents) {
            prompt << " " << agent;
        }
        prompt << "\n";
    }
    prompt << "\nCreate the project in the current directory and provide a summary when "
              "complete.\n";
    return prompt.str();
}

std::string build_startup_script(const std::string& credential_env) {
    std::ostringstream script;
    script << "#!/bin/bash\n"
           << "set -e\n"
           << "echo \"Starting Claude Code session...\"\n"
           << "if [ -z \"${" << credential_env << ":-}\" ]; then\n"
           << "    echo \"FATAL: " << credential_env << " is not set\"\n"
           << "    exit 1\n"
           << "fi\n"
           << "mkdir -p " << kContainerOutput << "\n"
           << "cd " << kContainerOutput << "\n"
           << "echo \"Launching Claude Code with project generation prompt...\"\n"
           << "claude --dangerously-skip-permissions --model \"${CLAUDE_MODEL}\" --print "
              "\"$(cat " << kContainerWorkspace << "/prompt.txt)\"\n"
           << "echo \"Generated files:\"\n"
           << "ls -la " << kContainerOutput << "/\n"
           << "echo \"Project generation complete\"\n";
    return script.str();
}

core::errors::Result<SessionScript> write_session_script(
    const protocol::WorkspaceLayout& layout, const std::string& idea,
    const std::vector<std::string>& agents, const std::string& credential_env) {
    SessionScript session;
    session.prompt_path = layout.root / "prompt.txt";
    session.script_path = layout.root / "startup.sh";

    auto prompt_written = write_text(session.prompt_path, build_prompt(idea, agents));
    if (core::errors::is_error(prompt_written)) {
        return core::errors::get_error(prompt_written);
    }
    auto script_written =
        write_text(session.script_path, build_startup_script(credential_env));
    if (core::errors::is_error(script_written)) {
        return core::errors::get_error(script_written);
    }

    std::error_code ec;
    std::filesystem::permissions(session.script_path,
                                 std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec |
                                     std::filesystem::perms::others_read |
                                     std::filesystem::perms::others_exec,
                                 ec);
    if (ec) {
        return ForgeError{ErrorCategory::Filesystem,
                          "Unable to mark startup script executable: " +
                              session.script_path.string(),
                          "session_write_failed",
                          "Check that the output directory allows changing file modes."};
    }

    session.command = {"bash", std::string(kContainerWorkspace) + "/startup.sh"};
    return session;
}

}  // namespace forge::orchestration
