#include "orchestrator/version_resolver.hpp"
#include "orchestrator/pipeline_utils.hpp"

#include <exception>
#include <fstream>
#include <sstream>
#include <system_error>

#ifndef PSB_SOURCE_DIR
#define PSB_SOURCE_DIR "."
#endif

namespace PSB {
namespace Orchestrator {

namespace {

std::optional<std::filesystem::path> executableDirectory() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return std::nullopt;
    }
    return exe.parent_path();
}

} // namespace

VersionResolver& VersionResolver::getInstance() {
    static VersionResolver instance;
    return instance;
}

VersionResolver::VersionResolver() : reader_(&VersionResolver::readFile) {}

std::string VersionResolver::getVersion() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cached_) {
        cached_ = resolve();
    }
    return *cached_;
}

void VersionResolver::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_.reset();
    reader_ = &VersionResolver::readFile;
    candidate_override_.reset();
}

void VersionResolver::setReader(Reader reader) {
    std::lock_guard<std::mutex> lock(mutex_);
    reader_ = reader ? std::move(reader) : Reader(&VersionResolver::readFile);
}

void VersionResolver::setCandidatePath(std::optional<std::filesystem::path> path) {
    std::lock_guard<std::mutex> lock(mutex_);
    candidate_override_ = std::move(path);
}

std::filesystem::path VersionResolver::candidatePath() const {
    if (candidate_override_) {
        return *candidate_override_;
    }

    // EN: An installed binary ships its VERSION under share/, next to bin/.
    // FR: Un binaire installé livre son VERSION sous share/, à côté de bin/.
    if (auto exe_dir = executableDirectory()) {
        auto packaged = *exe_dir / ".." / "share" / "papyrus" / "VERSION";
        std::error_code ec;
        if (std::filesystem::exists(packaged, ec)) {
            return packaged.lexically_normal();
        }
    }
    return std::filesystem::path(PSB_SOURCE_DIR) / "VERSION";
}

std::string VersionResolver::resolve() const {
    std::optional<std::string> content;
    try {
        content = reader_(candidatePath());
    } catch (const std::exception&) {
        // EN: An unreadable candidate is the same as a missing one.
        // FR: Un candidat illisible équivaut à un candidat absent.
        content.reset();
    }
    if (!content) {
        return kFallbackVersion;
    }
    std::string version = PipelineUtils::trim(*content);
    return version.empty() ? std::string(kFallbackVersion) : version;
}

std::optional<std::string> VersionResolver::readFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return content.str();
}

} // namespace Orchestrator
} // namespace PSB
