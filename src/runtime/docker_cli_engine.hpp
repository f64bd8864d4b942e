#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "runtime/container_engine.hpp"
#include "runtime/process_runner.hpp"

namespace forge::runtime {

struct DockerCliOptions {
    std::string binary = "docker";
    std::uint32_t command_timeout_ms = 60000;
    std::chrono::seconds build_timeout{1800};
};

// ContainerEngine backed by the docker command line client.
class DockerCliEngine : public ContainerEngine {
public:
    explicit DockerCliEngine(DockerCliOptions options = {});

    core::errors::Status ping() override;
    core::errors::Result<bool> image_exists(const std::string& image_ref) override;
    core::errors::Status build_image(const std::filesystem::path& context,
                                     const std::string& image_ref,
                                     bool no_cache,
                                     const CancelToken& cancel) override;
    core::errors::Result<std::string> run(const ContainerSpec& spec) override;
    core::errors::Result<std::unique_ptr<LineSource>> logs(
        const std::string& container_id) override;
    core::errors::Status stop(const std::string& container_id,
                              std::chrono::seconds grace) override;
    core::errors::Status kill(const std::string& container_id) override;
    core::errors::Status remove(const std::string& container_id) override;
    core::errors::Result<ContainerStatus> inspect(const std::string& container_id) override;
    core::errors::Result<int> wait(const std::string& container_id) override;

    // Arguments for `docker run`; secret values are passed by name only.
    static std::vector<std::string> run_arguments(const ContainerSpec& spec);

private:
    core::errors::Result<ProcessCapture> docker(const std::vector<std::string>& args,
                                                const ProcessOptions& options) const;
    ProcessOptions default_options() const;

    DockerCliOptions options_;
};

}  // namespace forge::runtime
