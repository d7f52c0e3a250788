#include "sandbox/code_materializer.hpp"

#include <fstream>
#include <sstream>

#include "nlohmann/json.hpp"
#include "sandbox/errors.hpp"

namespace execbox::sandbox {
namespace {

constexpr const char* kPreamble =
    "import os\n"
    "import sys\n"
    "try:\n"
    "    import matplotlib\n"
    "    matplotlib.use('Agg')\n"
    "    import matplotlib.pyplot as plt\n"
    "except ImportError:\n"
    "    matplotlib = None\n"
    "    plt = None\n"
    "\n";

constexpr const char* kPostamble =
    "try:\n"
    "    import matplotlib.pyplot as _execbox_plt\n"
    "except ImportError:\n"
    "    _execbox_plt = None\n"
    "if _execbox_plt is not None:\n"
    "    for _execbox_i, _execbox_num in enumerate(_execbox_plt.get_fignums()):\n"
    "        _execbox_fig = _execbox_plt.figure(_execbox_num)\n";

// JSON string literals with ASCII escapes are valid Python string literals.
std::string QuotePath(const std::filesystem::path& path) {
    try {
        return nlohmann::json(path.string()).dump(-1, ' ', true);
    } catch (const nlohmann::json::exception& ex) {
        throw MaterializationError("workspace path is not valid UTF-8: " + std::string(ex.what()));
    }
}

}  // namespace

CodeMaterializer::CodeMaterializer(int figure_dpi)
    : figure_dpi_(figure_dpi) {}

std::string CodeMaterializer::BuildProgram(const std::filesystem::path& workspace_dir,
                                           const std::string& code) const {
    const auto dir = QuotePath(workspace_dir);
    std::ostringstream program;
    program << kPreamble;
    program << "os.chdir(" << dir << ")\n";
    program << "\n# user code\n";
    program << code;
    if (code.empty() || code.back() != '\n') {
        program << "\n";
    }
    program << "\n";
    program << kPostamble;
    program << "        _execbox_fig.savefig(os.path.join(" << dir << ", \"" << kFigurePrefix
            << "%d.png\" % _execbox_i), dpi=" << figure_dpi_ << ", bbox_inches='tight')\n";
    program << "        _execbox_plt.close(_execbox_fig)\n";
    return program.str();
}

std::filesystem::path CodeMaterializer::Materialize(const Workspace& workspace,
                                                    const std::string& code) const {
    const auto script_path = workspace.path / kScriptName;
    const auto program = BuildProgram(workspace.path, code);

    std::ofstream output(script_path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw MaterializationError("cannot open " + script_path.string() + " for writing");
    }
    output << program;
    output.close();
    if (output.fail()) {
        throw MaterializationError("failed writing " + script_path.string());
    }
    return script_path;
}

}  // namespace execbox::sandbox
