#pragma once

#include <string>
#include <vector>

#include "sandbox/workspace_manager.hpp"

namespace execbox::sandbox {

struct ArtifactFile {
    std::string name;
    std::string base64;
    std::string mime_type;
};

class ArtifactCollector {
public:
    // Top-level *.png files in the workspace, sorted by filename (lexically,
    // so figure_10.png precedes figure_2.png).
    std::vector<ArtifactFile> Collect(const Workspace& workspace) const;
};

}  // namespace execbox::sandbox
