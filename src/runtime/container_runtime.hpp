#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "policy/mount_guard.hpp"
#include "runtime/container_engine.hpp"

namespace forge::runtime {

struct ContainerHandle {
    std::string id;
    std::string name;
    ContainerStatus status = ContainerStatus::Created;
    std::chrono::system_clock::time_point started_at;
};

struct ContainerLaunch {
    std::string image;
    std::string name;
    std::vector<Mount> mounts;
    std::vector<std::string> command;
    std::vector<EnvVar> env;
    std::string working_dir = "/workspace";
    std::string user;
    std::string network;
    std::map<std::string, std::string> labels;
};

// Owns the single container of one execution. Callers receive a const
// pointer to the handle; only this class changes its status.
//
// stop() and remove() never fail: errors are retried up to `attempts` times
// and then logged at WARN.
class ContainerRuntime {
public:
    ContainerRuntime(ContainerEngine& engine, policy::MountGuard guard, int attempts = 2);

    core::errors::Result<const ContainerHandle*> start(const ContainerLaunch& launch);

    void stop(std::chrono::seconds grace);
    void remove();

    core::errors::Result<ContainerStatus> status();
    core::errors::Result<int> wait_exit();

    const ContainerHandle* handle() const;

private:
    bool has_live_handle() const;

    ContainerEngine& engine_;
    policy::MountGuard guard_;
    int attempts_;
    mutable std::mutex mutex_;
    std::unique_ptr<ContainerHandle> handle_;
};

}  // namespace forge::runtime
