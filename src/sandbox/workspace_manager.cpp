#include "sandbox/workspace_manager.hpp"

#include "sandbox/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace execbox::sandbox {
namespace {

constexpr int kMaxAttempts = 8;
constexpr std::size_t kIdBytes = 16;

}  // namespace

WorkspaceManager::WorkspaceManager(std::filesystem::path root)
    : root_(std::move(root)) {}

Workspace WorkspaceManager::Acquire() const {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw ResourceError("cannot create scratch root " + root_.string() + ": " + ec.message());
    }
    if (!std::filesystem::is_directory(root_, ec)) {
        throw ResourceError("scratch root is not a directory: " + root_.string());
    }

    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        std::string id;
        try {
            id = "exec_" + utils::RandomHex(kIdBytes);
        } catch (const std::runtime_error& ex) {
            throw ResourceError(ex.what());
        }
        const auto path = root_ / id;
        const bool created = std::filesystem::create_directory(path, ec);
        if (ec) {
            throw ResourceError("cannot create workspace " + path.string() + ": " + ec.message());
        }
        if (created) {
            utils::Log(utils::LogLevel::kDebug, "workspace", "acquired", {{"id", id}});
            return Workspace{id, path};
        }
    }
    throw ResourceError("cannot allocate a unique workspace under " + root_.string());
}

void WorkspaceManager::Release(const Workspace& workspace) const noexcept {
    if (workspace.path.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(workspace.path, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "workspace", "cleanup failed",
                   {{"id", workspace.id}, {"error", ec.message()}});
        return;
    }
    utils::Log(utils::LogLevel::kDebug, "workspace", "released", {{"id", workspace.id}});
}

WorkspaceLease::WorkspaceLease(const WorkspaceManager& manager)
    : manager_(manager) {}

WorkspaceLease::~WorkspaceLease() {
    Release();
}

const Workspace& WorkspaceLease::Acquire() {
    if (!workspace_) {
        workspace_ = manager_.Acquire();
    }
    return *workspace_;
}

void WorkspaceLease::Release() noexcept {
    if (!workspace_) {
        return;
    }
    manager_.Release(*workspace_);
    workspace_.reset();
}

}  // namespace execbox::sandbox
