#pragma once

#include <core/model/upload.h>
#include <string>

namespace deckhand::cli {

// Single rewritten console line for a running upload
class ProgressDisplay {
public:
    void UpdateProgress(const core::UploadProgress& progress);
    void ClearProgress();

    static std::string Format(const core::UploadProgress& progress);
    static std::string FormatBytes(double bytes);
};

} // namespace deckhand::cli
