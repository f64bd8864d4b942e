#include "runtime/container_runtime.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace forge::runtime {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

ContainerRuntime::ContainerRuntime(ContainerEngine& engine, policy::MountGuard guard,
                                   const int attempts)
    : engine_(engine), guard_(std::move(guard)), attempts_(attempts < 1 ? 1 : attempts) {}

bool ContainerRuntime::has_live_handle() const {
    return handle_ != nullptr && handle_->status != ContainerStatus::Removed;
}

const ContainerHandle* ContainerRuntime::handle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_.get();
}

core::errors::Result<const ContainerHandle*> ContainerRuntime::start(
    const ContainerLaunch& launch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (has_live_handle()) {
        return ForgeError{ErrorCategory::RuntimeStart,
                          "A container is already running for this execution: " +
                              handle_->id,
                          "container_already_started"};
    }

    auto mounts = guard_.validate_mounts(launch.mounts);
    if (core::errors::is_error(mounts)) {
        return core::errors::get_error(mounts);
    }
    auto env_ok = guard_.validate_env(launch.env);
    if (core::errors::is_error(env_ok)) {
        return core::errors::get_error(env_ok);
    }
    auto command_ok = guard_.validate_command(launch.command);
    if (core::errors::is_error(command_ok)) {
        return core::errors::get_error(command_ok);
    }

    auto reachable = engine_.ping();
    if (core::errors::is_error(reachable)) {
        return core::errors::get_error(reachable);
    }

    ContainerSpec spec;
    spec.image = launch.image;
    spec.name = launch.name;
    spec.mounts = core::errors::get_value(mounts);
    spec.env = launch.env;
    spec.command = launch.command;
    spec.working_dir = launch.working_dir;
    spec.user = launch.user;
    spec.network = launch.network;
    spec.labels = launch.labels;

    LOG_INFO("Starting container " + launch.name + " from " + launch.image);
    for (const auto& var : spec.env) {
        LOG_DEBUG("  env " + var.name + (var.secret ? "=<redacted>" : "=" + var.value));
    }

    auto started = engine_.run(spec);
    if (core::errors::is_error(started)) {
        auto error = core::errors::get_error(started);
        error.category = ErrorCategory::RuntimeStart;
        return error;
    }

    handle_ = std::make_unique<ContainerHandle>();
    handle_->id = core::errors::get_value(started);
    handle_->name = launch.name;
    handle_->status = ContainerStatus::Running;
    handle_->started_at = std::chrono::system_clock::now();
    LOG_INFO("Container started: " + handle_->id.substr(0, 12));
    return static_cast<const ContainerHandle*>(handle_.get());
}

void ContainerRuntime::stop(const std::chrono::seconds grace) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_ == nullptr || handle_->status == ContainerStatus::Exited ||
        handle_->status == ContainerStatus::Removed) {
        return;
    }

    for (int attempt = 1; attempt <= attempts_; ++attempt) {
        auto stopped = engine_.stop(handle_->id, grace);
        if (!core::errors::is_error(stopped)) {
            handle_->status = ContainerStatus::Exited;
            LOG_INFO("Container stopped: " + handle_->id.substr(0, 12));
            return;
        }
        LOG_WARN("Stop attempt " + std::to_string(attempt) + " failed: " +
                 core::errors::get_error(stopped).message);
    }

    auto killed = engine_.kill(handle_->id);
    if (core::errors::is_error(killed)) {
        LOG_WARN("Failed to kill container " + handle_->id + ": " +
                 core::errors::get_error(killed).message);
        return;
    }
    handle_->status = ContainerStatus::Exited;
    LOG_WARN("Container killed after failed stop: " + handle_->id.substr(0, 12));
}

void ContainerRuntime::remove() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_ == nullptr || handle_->status == ContainerStatus::Removed) {
        return;
    }

    for (int attempt = 1; attempt <= attempts_; ++attempt) {
        auto removed = engine_.remove(handle_->id);
        if (!core::errors::is_error(removed)) {
            handle_->status = ContainerStatus::Removed;
            LOG_INFO("Container removed: " + handle_->id.substr(0, 12));
            return;
        }
        LOG_WARN("Remove attempt " + std::to_string(attempt) + " failed: " +
                 core::errors::get_error(removed).message);
    }
    LOG_WARN("Container " + handle_->id + " was not removed; remove it manually.");
}

core::errors::Result<ContainerStatus> ContainerRuntime::status() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_ == nullptr) {
        return ForgeError{ErrorCategory::Internal, "No container has been started.",
                          "no_container"};
    }
    if (handle_->status == ContainerStatus::Removed) {
        return ContainerStatus::Removed;
    }
    auto polled = engine_.inspect(handle_->id);
    if (core::errors::is_error(polled)) {
        return core::errors::get_error(polled);
    }
    const auto observed = core::errors::get_value(polled);
    if (observed != ContainerStatus::Unknown) {
        handle_->status = observed;
    }
    return observed;
}

core::errors::Result<int> ContainerRuntime::wait_exit() {
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (handle_ == nullptr || handle_->status == ContainerStatus::Removed) {
            return ForgeError{ErrorCategory::Internal, "No live container to wait for.",
                              "no_container"};
        }
        id = handle_->id;
    }

    auto exited = engine_.wait(id);
    if (core::errors::is_error(exited)) {
        return core::errors::get_error(exited);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_->status != ContainerStatus::Removed) {
        handle_->status = ContainerStatus::Exited;
    }
    return core::errors::get_value(exited);
}

}  // namespace forge::runtime
