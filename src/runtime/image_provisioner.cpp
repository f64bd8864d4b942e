#include "runtime/image_provisioner.hpp"

#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace forge::runtime {

using core::errors::ErrorCategory;
using core::errors::ForgeError;

ImageProvisioner::ImageProvisioner(ContainerEngine& engine, std::string name,
                                   std::string tag,
                                   std::filesystem::path build_context)
    : engine_(engine),
      name_(std::move(name)),
      tag_(std::move(tag)),
      build_context_(std::move(build_context)) {}

core::errors::Status ImageProvisioner::validate_build_context() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(build_context_, ec) || ec) {
        return ForgeError{ErrorCategory::Build,
                          "Build context is not a directory: " + build_context_.string(),
                          "build_context_missing",
                          "Set FORGE_BUILD_CONTEXT or image.build_context to the "
                          "directory holding the Dockerfile."};
    }
    if (!std::filesystem::is_regular_file(build_context_ / "Dockerfile", ec) || ec) {
        return ForgeError{ErrorCategory::Build,
                          "No Dockerfile in build context: " + build_context_.string(),
                          "build_context_missing",
                          "Add a Dockerfile to " + build_context_.string() + "."};
    }
    return core::errors::ok();
}

core::errors::Result<ImageRef> ImageProvisioner::ensure(const bool force_rebuild,
                                                  const CancelToken& cancel) const {
    ImageRef image{name_, tag_, false};

    if (!force_rebuild) {
        auto exists = engine_.image_exists(image.ref());
        if (core::errors::is_error(exists)) {
            return core::errors::get_error(exists);
        }
        if (core::errors::get_value(exists)) {
            LOG_INFO("Using cached image " + image.ref());
            return image;
        }
        LOG_INFO("Image " + image.ref() + " not found locally; building.");
    } else {
        LOG_INFO("Rebuilding image " + image.ref() + " without cache.");
    }

    auto context_ok = validate_build_context();
    if (core::errors::is_error(context_ok)) {
        return core::errors::get_error(context_ok);
    }

    auto built = engine_.build_image(build_context_, image.ref(), force_rebuild, cancel);
    if (core::errors::is_error(built)) {
        auto error = core::errors::get_error(built);
        if (error.category == ErrorCategory::Cancelled) {
            LOG_WARN("Image build cancelled: " + image.ref());
            return error;
        }
        if (error.category != ErrorCategory::RuntimeStart) {
            error.category = ErrorCategory::Build;
        }
        LOG_ERROR("Image build failed [" + error.code + "]: " + error.message);
        return error;
    }

    image.built = true;
    LOG_INFO("Built image " + image.ref());
    return image;
}

}  // namespace forge::runtime
