// EN: The build orchestrator: runs the ordered step catalogue against one shared build context.
// FR: L'orchestrateur de build : exécute le catalogue ordonné d'étapes sur un contexte partagé.

#pragma once

#include "orchestrator/build_context.hpp"
#include "orchestrator/build_options.hpp"
#include "orchestrator/step.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace PSB {
namespace Orchestrator {

// EN: Module name used for every log entry emitted by the orchestrator.
// FR: Nom de module utilisé pour chaque entrée de log émise par l'orchestrateur.
inline constexpr const char* kBuilderLogModule = "builder";

/**
 * EN: Sequential pipeline over a fixed catalogue of steps.
 *     build() instantiates and initialises every step, keeps those whose canProcess() is true
 *     (catalogue order preserved) and runs them one after the other. A failure in init(),
 *     canProcess() or process() aborts the build and is rethrown as StepFailure; the work of
 *     the steps already run is kept as is.
 * FR: Pipeline séquentiel sur un catalogue fixe d'étapes.
 *     build() instancie et initialise chaque étape, garde celles dont canProcess() est vrai
 *     (ordre du catalogue conservé) et les exécute l'une après l'autre. Un échec dans init(),
 *     canProcess() ou process() interrompt le build et est relancé en StepFailure ; le travail
 *     des étapes déjà exécutées est conservé tel quel.
 */
class Builder {
public:
    // EN: Builder over the default step catalogue and generators. Null handles are replaced by fresh instances.
    // FR: Builder sur le catalogue et les générateurs par défaut. Les handles nuls sont remplacés par des instances neuves.
    explicit Builder(std::shared_ptr<SiteConfig> config = nullptr,
                     std::shared_ptr<Logger> logger = nullptr);

    Builder(std::shared_ptr<SiteConfig> config,
            std::shared_ptr<Logger> logger,
            std::vector<StepSpec> catalogue);

    Builder(const Builder&) = delete;
    Builder& operator=(const Builder&) = delete;

    // EN: Run one full init + process pass. Throws StepFailure when a step fails.
    // FR: Exécute une passe complète init + process. Lance StepFailure si une étape échoue.
    Builder& build(const BuildOptionMap& overrides = {});

    // EN: Append a step to the catalogue; it runs after every existing entry.
    // FR: Ajoute une étape au catalogue ; elle s'exécute après toutes les entrées existantes.
    Builder& addStep(StepSpec spec);
    const std::vector<StepSpec>& getCatalogue() const { return catalogue_; }

    // EN: Engine version, resolved once per process.
    // FR: Version du moteur, résolue une fois par processus.
    static std::string getVersion();

    // EN: Configuration. Replacing it is refused once a build has started.
    // FR: Configuration. Son remplacement est refusé une fois un build démarré.
    SiteConfig& getConfig() { return context_.getConfig(); }
    const SiteConfig& getConfig() const { return context_.getConfig(); }
    Builder& setConfig(std::shared_ptr<SiteConfig> config);

    const std::filesystem::path& getSourceDir() const { return context_.getConfig().getSourceDir(); }
    Builder& setSourceDir(const std::optional<std::filesystem::path>& source_dir);
    const std::filesystem::path& getDestinationDir() const { return context_.getConfig().getDestinationDir(); }
    Builder& setDestinationDir(const std::optional<std::filesystem::path>& destination_dir);

    void setPagesFiles(std::vector<std::filesystem::path> files) { context_.setPagesFiles(std::move(files)); }
    const std::vector<std::filesystem::path>& getPagesFiles() const { return context_.getPagesFiles(); }

    void setPages(Content::PageCollection pages) { context_.setPages(std::move(pages)); }
    Content::PageCollection& getPages() { return context_.getPages(); }
    const Content::PageCollection& getPages() const { return context_.getPages(); }

    void setData(Content::DataCollection data) { context_.setData(std::move(data)); }
    Content::DataCollection& getData() { return context_.getData(); }
    const Content::DataCollection& getData() const { return context_.getData(); }

    void setStatic(Content::StaticFileCollection files) { context_.setStatic(std::move(files)); }
    Content::StaticFileCollection& getStatic() { return context_.getStatic(); }
    const Content::StaticFileCollection& getStatic() const { return context_.getStatic(); }

    void setMenus(std::map<std::string, Content::MenuCollection> menus) { context_.setMenus(std::move(menus)); }
    const Content::MenuCollection& getMenus(const std::string& language) const { return context_.getMenus(language); }

    void setTaxonomies(Content::TaxonomyCollection taxonomies) { context_.setTaxonomies(std::move(taxonomies)); }
    Content::TaxonomyCollection& getTaxonomies() { return context_.getTaxonomies(); }
    const Content::TaxonomyCollection& getTaxonomies() const { return context_.getTaxonomies(); }

    void setRenderer(std::shared_ptr<Content::RendererInterface> renderer) { context_.setRenderer(std::move(renderer)); }
    Content::RendererInterface& getRenderer() const { return context_.getRenderer(); }

    bool isDebug() const { return context_.isDebug(); }
    const BuildOptions& getBuildOptions() const { return options_; }
    Logger& getLogger() const { return context_.getLogger(); }

    BuildContext& getContext() { return context_; }
    const BuildContext& getContext() const { return context_; }

    // EN: Number of build() calls that got past option resolution.
    // FR: Nombre d'appels à build() ayant dépassé la résolution des options.
    std::size_t getBuildCount() const { return build_count_; }

private:
    std::vector<std::unique_ptr<StepInterface>> initSteps();
    void processSteps(const std::vector<std::unique_ptr<StepInterface>>& steps);
    void checkBaseUrl();

    std::vector<StepSpec> catalogue_;
    BuildContext context_;
    BuildOptions options_;
    std::size_t build_count_ = 0;
};

} // namespace Orchestrator
} // namespace PSB
