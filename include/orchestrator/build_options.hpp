// EN: Build options: caller overrides merged onto fixed defaults.
// FR: Options de build : surcharges de l'appelant fusionnées sur des valeurs par défaut fixes.

#pragma once

#include "infrastructure/config/site_config.hpp"
#include "infrastructure/logging/logger.hpp"

#include <map>
#include <string>

namespace PSB {
namespace Orchestrator {

// EN: Raw overrides as passed to Builder::build() ("drafts", "dry-run", "page", or step-private keys).
// FR: Surcharges brutes passées à Builder::build() ("drafts", "dry-run", "page", ou clés privées d'étapes).
using BuildOptionMap = std::map<std::string, ConfigValue>;

// EN: Immutable resolved options of one build.
// FR: Options résolues et immuables d'un build.
class BuildOptions {
public:
    static constexpr const char* kDrafts = "drafts";
    static constexpr const char* kDryRun = "dry-run";
    static constexpr const char* kPage = "page";

    // EN: Defaults only: no drafts, no dry-run, no page filter.
    // FR: Valeurs par défaut uniquement : pas de brouillons, pas de dry-run, pas de filtre.
    BuildOptions() = default;

    // EN: Resolve overrides onto the defaults. Never fails: an unusable value keeps the default and is
    //     reported at DEBUG on `logger` (the process-wide logger when null).
    // FR: Résout les surcharges sur les valeurs par défaut. N'échoue jamais : une valeur inutilisable garde
    //     le défaut et est signalée en DEBUG sur `logger` (le logger global si nul).
    static BuildOptions resolve(const BuildOptionMap& overrides, Logger* logger = nullptr);

    bool includeDrafts() const { return include_drafts_; }
    bool isDryRun() const { return dry_run_; }
    const std::string& pageFilter() const { return page_filter_; }
    bool hasPageFilter() const { return !page_filter_.empty(); }

    // EN: Any option by key, recognised or pass-through. Empty ConfigValue when absent.
    // FR: N'importe quelle option par clé, reconnue ou transmise. ConfigValue vide si absente.
    ConfigValue get(const std::string& key) const;

    // EN: Unrecognised keys, kept as given for step-specific flags.
    // FR: Clés non reconnues, conservées telles quelles pour les options propres aux étapes.
    const BuildOptionMap& extras() const { return extras_; }

    // EN: Every option, recognised keys included, as a flat map.
    // FR: Toutes les options, clés reconnues incluses, en map plate.
    BuildOptionMap toMap() const;

private:
    bool include_drafts_ = false;
    bool dry_run_ = false;
    std::string page_filter_;
    BuildOptionMap extras_;
};

} // namespace Orchestrator
} // namespace PSB
