// EN: Process-wide engine version, read once from a VERSION file with a built-in fallback.
// FR: Version du moteur pour tout le processus, lue une fois depuis un fichier VERSION avec repli intégré.

#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace PSB {
namespace Orchestrator {

// EN: Version reported when no VERSION file can be read.
// FR: Version annoncée quand aucun fichier VERSION n'est lisible.
inline constexpr const char* kFallbackVersion = "1.0.0-dev";

class VersionResolver {
public:
    // EN: Returns the file content, or nullopt when it is missing or unreadable.
    // FR: Retourne le contenu du fichier, ou nullopt s'il est absent ou illisible.
    using Reader = std::function<std::optional<std::string>(const std::filesystem::path&)>;

    static VersionResolver& getInstance();

    VersionResolver(const VersionResolver&) = delete;
    VersionResolver& operator=(const VersionResolver&) = delete;

    // EN: Cached after the first call; never throws.
    // FR: Mis en cache après le premier appel ; ne lance jamais d'exception.
    std::string getVersion();

    // EN: Test hooks. reset() drops the cache, the reader and the path override.
    // FR: Points d'accroche de test. reset() vide le cache, le lecteur et le chemin forcé.
    void reset();
    void setReader(Reader reader);
    void setCandidatePath(std::optional<std::filesystem::path> path);

    // EN: <exe_dir>/../share/papyrus/VERSION when installed, <source_dir>/VERSION otherwise.
    // FR: <exe_dir>/../share/papyrus/VERSION si installé, <source_dir>/VERSION sinon.
    std::filesystem::path candidatePath() const;

    static std::optional<std::string> readFile(const std::filesystem::path& path);

private:
    VersionResolver();

    std::string resolve() const;

    mutable std::mutex mutex_;
    std::optional<std::string> cached_;
    Reader reader_;
    std::optional<std::filesystem::path> candidate_override_;
};

} // namespace Orchestrator
} // namespace PSB
