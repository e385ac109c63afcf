// EN: Virtual page generators and their priority-ordered registry.
// FR: Générateurs de pages virtuelles et leur registre ordonné par priorité.

#pragma once

#include "content/page.hpp"
#include "content/taxonomy.hpp"
#include "infrastructure/config/site_config.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace PSB {
namespace Content {

// EN: A generator derives virtual pages from the pages and taxonomies collected so far.
// FR: Un générateur dérive des pages virtuelles des pages et taxonomies collectées jusqu'ici.
class GeneratorInterface {
public:
    virtual ~GeneratorInterface() = default;

    virtual std::string getName() const = 0;

    // EN: Return the pages to add or replace. Must not modify its inputs.
    // FR: Retourne les pages à ajouter ou remplacer. Ne doit pas modifier ses entrées.
    virtual PageCollection generate(const PageCollection& pages,
                                    const TaxonomyCollection& taxonomies,
                                    const SiteConfig& config) = 0;
};

// EN: Registry of generators, run by ascending priority (registration order breaks ties).
// FR: Registre de générateurs, exécutés par priorité croissante (l'ordre d'ajout départage).
class GeneratorManager {
public:
    void addGenerator(int priority, std::unique_ptr<GeneratorInterface> generator);

    std::vector<std::string> getNames() const;
    std::size_t size() const { return generators_.size(); }
    bool empty() const { return generators_.empty(); }
    void clear() { generators_.clear(); }

    // EN: Run every generator and merge its output into `pages`. Returns the number of pages merged.
    // FR: Exécute chaque générateur et fusionne sa sortie dans `pages`. Retourne le nombre de pages fusionnées.
    std::size_t process(PageCollection& pages, const TaxonomyCollection& taxonomies,
                        const SiteConfig& config, Logger& logger);

private:
    struct Entry {
        int priority;
        std::unique_ptr<GeneratorInterface> generator;
    };

    std::vector<Entry> generators_;
};

// EN: Creates a redirect page for every entry of a page's "aliases" list.
// FR: Crée une page de redirection pour chaque entrée de la liste "aliases" d'une page.
class AliasRedirectGenerator : public GeneratorInterface {
public:
    std::string getName() const override { return "alias-redirect"; }
    PageCollection generate(const PageCollection& pages,
                            const TaxonomyCollection& taxonomies,
                            const SiteConfig& config) override;
};

} // namespace Content
} // namespace PSB
