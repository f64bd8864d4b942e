#include "runtime/log_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace forge::runtime {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string strip(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

void lowercase_all(std::vector<std::string>& values) {
    for (auto& value : values) {
        value = lowercase(value);
    }
}

}  // namespace

LogClassifier::LogClassifier(core::config::MarkerSet markers)
    : markers_(std::move(markers)) {
    lowercase_all(markers_.completion);
    lowercase_all(markers_.fatal);
}

LineClassification LogClassifier::classify(const std::string& line) const {
    LineClassification result;
    const std::string trimmed = strip(line);
    const std::string lowered = lowercase(trimmed);

    for (const auto& marker : markers_.fatal) {
        if (!marker.empty() && lowered.rfind(marker, 0) == 0) {
            result.kind = LineKind::Failed;
            result.detail = strip(trimmed.substr(marker.size()));
            return result;
        }
    }

    for (const auto& marker : markers_.completion) {
        if (!marker.empty() && lowered.find(marker) != std::string::npos) {
            result.kind = LineKind::Completed;
            return result;
        }
    }

    result.looks_like_error = lowered.find("error") != std::string::npos ||
                              lowered.find("failed") != std::string::npos ||
                              lowered.find("exception") != std::string::npos;
    return result;
}

}  // namespace forge::runtime
