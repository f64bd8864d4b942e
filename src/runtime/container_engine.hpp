#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "runtime/line_source.hpp"

namespace forge::runtime {

// Set from another thread to abort a long-running engine operation.
using CancelToken = std::shared_ptr<std::atomic_bool>;

struct Mount {
    std::filesystem::path host_path;
    std::string container_path;
    bool read_only = false;
};

struct EnvVar {
    std::string name;
    std::string value;
    bool secret = false;  // value must never reach logs or command lines
};

struct ContainerSpec {
    std::string image;
    std::string name;
    std::vector<Mount> mounts;
    std::vector<EnvVar> env;
    std::vector<std::string> command;
    std::string working_dir;
    std::string user;
    std::string network;
    std::map<std::string, std::string> labels;
};

enum class ContainerStatus {
    Created,
    Running,
    Exited,
    Removed,
    Unknown
};

inline std::string to_string(const ContainerStatus status) {
    switch (status) {
        case ContainerStatus::Created:
            return "created";
        case ContainerStatus::Running:
            return "running";
        case ContainerStatus::Exited:
            return "exited";
        case ContainerStatus::Removed:
            return "removed";
        default:
            return "unknown";
    }
}

// Container engine operations used by the image and container layers.
// Implementations report engine failures with a RuntimeStart category unless
// noted otherwise.
class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    virtual core::errors::Status ping() = 0;

    virtual core::errors::Result<bool> image_exists(const std::string& image_ref) = 0;

    // Build failures are reported with the Build category. Setting `cancel`
    // aborts the build with a Cancelled error.
    virtual core::errors::Status build_image(const std::filesystem::path& context,
                                             const std::string& image_ref,
                                             bool no_cache,
                                             const CancelToken& cancel) = 0;

    // Starts a detached container and returns its id.
    virtual core::errors::Result<std::string> run(const ContainerSpec& spec) = 0;

    // Follows the container's combined output from the beginning.
    virtual core::errors::Result<std::unique_ptr<LineSource>> logs(
        const std::string& container_id) = 0;

    virtual core::errors::Status stop(const std::string& container_id,
                                      std::chrono::seconds grace) = 0;
    virtual core::errors::Status kill(const std::string& container_id) = 0;
    virtual core::errors::Status remove(const std::string& container_id) = 0;

    virtual core::errors::Result<ContainerStatus> inspect(
        const std::string& container_id) = 0;

    // Blocks until the container exits and returns its exit code.
    virtual core::errors::Result<int> wait(const std::string& container_id) = 0;
};

}  // namespace forge::runtime
