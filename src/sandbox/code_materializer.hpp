#pragma once

#include <filesystem>
#include <string>

#include "sandbox/workspace_manager.hpp"

namespace execbox::sandbox {

// Wraps user code with the matplotlib/chdir preamble and the figure export
// postamble and writes it to <workspace>/script.py.
class CodeMaterializer {
public:
    static constexpr const char* kScriptName = "script.py";
    static constexpr const char* kFigurePrefix = "figure_";

    explicit CodeMaterializer(int figure_dpi = 150);

    // Throws MaterializationError when the script cannot be written.
    std::filesystem::path Materialize(const Workspace& workspace, const std::string& code) const;

    // The user code is inserted as-is; only the workspace path is escaped.
    std::string BuildProgram(const std::filesystem::path& workspace_dir, const std::string& code) const;

private:
    int figure_dpi_;
};

}  // namespace execbox::sandbox
