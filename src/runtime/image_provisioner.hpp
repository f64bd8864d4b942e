#pragma once

#include <filesystem>
#include <string>
#include "core/errors/forge_errors.hpp"
#include "runtime/container_engine.hpp"

namespace forge::runtime {

struct ImageRef {
    std::string name;
    std::string tag;
    bool built = false;  // true when this call produced the image

    std::string ref() const { return name + ":" + tag; }
};

// Makes sure the runtime image is present locally. Builds are not serialised
// across processes: two provisioners racing on a missing image both build.
class ImageProvisioner {
public:
    ImageProvisioner(ContainerEngine& engine, std::string name, std::string tag,
                     std::filesystem::path build_context);

    // A set `cancel` token aborts an image build; the error then keeps the
    // Cancelled category.
    core::errors::Result<ImageRef> ensure(bool force_rebuild,
                                          const CancelToken& cancel = nullptr) const;

    core::errors::Status validate_build_context() const;

private:
    ContainerEngine& engine_;
    std::string name_;
    std::string tag_;
    std::filesystem::path build_context_;
};

}  // namespace forge::runtime
