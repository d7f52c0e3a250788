#include "sandbox/artifact_collector.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace execbox::sandbox {
namespace {

constexpr const char* kImageExtension = ".png";
constexpr const char* kImageMime = "image/png";

}  // namespace

std::vector<ArtifactFile> ArtifactCollector::Collect(const Workspace& workspace) const {
    std::vector<std::filesystem::path> matches;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(workspace.path, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code type_ec;
        const auto name = entry.path().filename().string();
        if (name.empty() || name.front() == '.') {
            continue;
        }
        if (!entry.is_regular_file(type_ec) || entry.path().extension() != kImageExtension) {
            continue;
        }
        matches.push_back(entry.path());
    }
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "exec", "artifact scan incomplete",
                   {{"id", workspace.id}, {"error", ec.message()}});
    }
    std::sort(matches.begin(), matches.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.filename().string() < rhs.filename().string();
    });

    std::vector<ArtifactFile> files;
    files.reserve(matches.size());
    for (const auto& path : matches) {
        std::ifstream input(path, std::ios::binary);
        if (!input.is_open()) {
            continue;
        }
        std::vector<unsigned char> bytes(
            (std::istreambuf_iterator<char>(input)),
            std::istreambuf_iterator<char>());
        if (input.bad()) {
            continue;
        }
        files.push_back(ArtifactFile{
            path.filename().string(),
            utils::EncodeBase64(bytes),
            kImageMime});
    }
    return files;
}

}  // namespace execbox::sandbox
