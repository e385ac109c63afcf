// EN: Shared mutable state threaded through every build step.
// FR: État mutable partagé transmis à chaque étape de build.

#pragma once

#include "content/generator.hpp"
#include "content/menu.hpp"
#include "content/page.hpp"
#include "content/renderer.hpp"
#include "content/static_file.hpp"
#include "content/taxonomy.hpp"
#include "infrastructure/config/site_config.hpp"
#include "infrastructure/logging/logger.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace PSB {
namespace Orchestrator {

// EN: Name of the environment variable forcing debug mode when set to "true".
// FR: Nom de la variable d'environnement forçant le mode debug si elle vaut "true".
inline constexpr const char* kDebugEnvironmentVariable = "PAPYRUS_DEBUG";

// EN: One context per Builder, reused across builds. The builder never clears any collection:
//     the load and create steps own the reset policy of the collections they fill.
// FR: Un contexte par Builder, réutilisé d'un build à l'autre. Le builder ne vide aucune collection :
//     les étapes de chargement et de création décident de la remise à zéro de leurs collections.
class BuildContext {
public:
    BuildContext(std::shared_ptr<SiteConfig> config, std::shared_ptr<Logger> logger);

    BuildContext(const BuildContext&) = delete;
    BuildContext& operator=(const BuildContext&) = delete;

    SiteConfig& getConfig() { return *config_; }
    const SiteConfig& getConfig() const { return *config_; }
    std::shared_ptr<SiteConfig> getConfigHandle() const { return config_; }
    void setConfig(std::shared_ptr<SiteConfig> config);

    Logger& getLogger() const { return *logger_; }
    std::shared_ptr<Logger> getLoggerHandle() const { return logger_; }
    void setLogger(std::shared_ptr<Logger> logger);

    // EN: Resolved once at construction (config "debug" or PAPYRUS_DEBUG=true).
    // FR: Résolu une seule fois à la construction (config "debug" ou PAPYRUS_DEBUG=true).
    bool isDebug() const { return debug_; }

    void setPagesFiles(std::vector<std::filesystem::path> files) { pages_files_ = std::move(files); }
    const std::vector<std::filesystem::path>& getPagesFiles() const { return pages_files_; }

    void setData(Content::DataCollection data) { data_ = std::move(data); }
    Content::DataCollection& getData() { return data_; }
    const Content::DataCollection& getData() const { return data_; }

    void setStatic(Content::StaticFileCollection files) { static_ = std::move(files); }
    Content::StaticFileCollection& getStatic() { return static_; }
    const Content::StaticFileCollection& getStatic() const { return static_; }

    // EN: The single pages collection. setPages() swaps content into it, never the instance.
    // FR: L'unique collection de pages. setPages() y transfère le contenu, jamais l'instance.
    void setPages(Content::PageCollection pages) { pages_ = std::move(pages); }
    Content::PageCollection& getPages() { return pages_; }
    const Content::PageCollection& getPages() const { return pages_; }

    void setMenus(std::map<std::string, Content::MenuCollection> menus) { menus_ = std::move(menus); }
    // EN: Throws CollectionError for a language without menus.
    // FR: Lance CollectionError pour une langue sans menus.
    const Content::MenuCollection& getMenus(const std::string& language) const;
    const std::map<std::string, Content::MenuCollection>& getAllMenus() const { return menus_; }
    bool hasMenus(const std::string& language) const { return menus_.count(language) > 0; }

    void setTaxonomies(Content::TaxonomyCollection taxonomies) { taxonomies_ = std::move(taxonomies); }
    Content::TaxonomyCollection& getTaxonomies() { return taxonomies_; }
    const Content::TaxonomyCollection& getTaxonomies() const { return taxonomies_; }

    void setRenderer(std::shared_ptr<Content::RendererInterface> renderer) { renderer_ = std::move(renderer); }
    // EN: Throws BuildError when no renderer has been installed yet.
    // FR: Lance BuildError si aucun moteur de rendu n'est encore installé.
    Content::RendererInterface& getRenderer() const;
    bool hasRenderer() const { return static_cast<bool>(renderer_); }

    Content::GeneratorManager& getGeneratorManager() { return generators_; }
    const Content::GeneratorManager& getGeneratorManager() const { return generators_; }

    // EN: Drop every menu entry and taxonomy link that points at a page, then the page itself.
    // FR: Retire toute entrée de menu et tout lien de taxonomie visant une page, puis la page elle-même.
    bool removePage(const std::string& page_id);

private:
    static bool resolveDebug(const SiteConfig& config);

    std::shared_ptr<SiteConfig> config_;
    std::shared_ptr<Logger> logger_;
    bool debug_ = false;

    std::vector<std::filesystem::path> pages_files_;
    Content::DataCollection data_;
    Content::StaticFileCollection static_;
    Content::PageCollection pages_;
    std::map<std::string, Content::MenuCollection> menus_;
    Content::TaxonomyCollection taxonomies_;
    std::shared_ptr<Content::RendererInterface> renderer_;
    Content::GeneratorManager generators_;
};

} // namespace Orchestrator
} // namespace PSB
