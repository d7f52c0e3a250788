#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace execbox::sandbox {

struct Workspace {
    std::string id;
    std::filesystem::path path;
};

class WorkspaceManager {
public:
    explicit WorkspaceManager(std::filesystem::path root);

    // Creates root/exec_<random hex>. Throws ResourceError on failure.
    Workspace Acquire() const;

    // Best-effort recursive removal. Never throws; safe to call twice.
    void Release(const Workspace& workspace) const noexcept;

    const std::filesystem::path& Root() const { return root_; }

private:
    std::filesystem::path root_;
};

// Holds at most one workspace and releases it when it goes out of scope.
class WorkspaceLease {
public:
    explicit WorkspaceLease(const WorkspaceManager& manager);
    ~WorkspaceLease();

    WorkspaceLease(const WorkspaceLease&) = delete;
    WorkspaceLease& operator=(const WorkspaceLease&) = delete;

    const Workspace& Acquire();
    void Release() noexcept;

    bool Held() const { return workspace_.has_value(); }

private:
    const WorkspaceManager& manager_;
    std::optional<Workspace> workspace_;
};

}  // namespace execbox::sandbox
