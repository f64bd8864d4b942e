#pragma once

#include <string>
#include "core/config/settings.hpp"

namespace forge::runtime {

enum class LineKind {
    Progress,
    Completed,
    Failed
};

struct LineClassification {
    LineKind kind = LineKind::Progress;
    // Text after a fatal marker. Empty when the marker carried no detail.
    std::string detail;
    bool looks_like_error = false;
};

// Maps a single container output line to a progress or terminal signal.
// A fatal prefix is checked before completion markers, so a line carrying
// both is a failure.
class LogClassifier {
public:
    explicit LogClassifier(core::config::MarkerSet markers = {});

    LineClassification classify(const std::string& line) const;

private:
    core::config::MarkerSet markers_;
};

}  // namespace forge::runtime
