// EN: Generator manager and built-in generators.
// FR: Gestionnaire de générateurs et générateurs intégrés.

#include "content/generator.hpp"

#include <algorithm>

namespace PSB {
namespace Content {

void GeneratorManager::addGenerator(int priority, std::unique_ptr<GeneratorInterface> generator) {
    if (!generator) {
        return;
    }
    Entry entry{priority, std::move(generator)};
    auto it = std::upper_bound(generators_.begin(), generators_.end(), entry.priority,
                               [](int p, const Entry& e) { return p < e.priority; });
    generators_.insert(it, std::move(entry));
}

std::vector<std::string> GeneratorManager::getNames() const {
    std::vector<std::string> names;
    names.reserve(generators_.size());
    for (const auto& entry : generators_) {
        names.push_back(entry.generator->getName());
    }
    return names;
}

// EN: Each generator sees the output of the previous ones.
// FR: Chaque générateur voit la sortie des précédents.
std::size_t GeneratorManager::process(PageCollection& pages, const TaxonomyCollection& taxonomies,
                                      const SiteConfig& config, Logger& logger) {
    std::size_t merged = 0;
    std::size_t index = 0;
    for (const auto& entry : generators_) {
        ++index;
        PageCollection generated = entry.generator->generate(pages, taxonomies, config);
        for (auto& page : generated) {
            page.is_virtual = true;
            pages.replace(std::move(page));
            ++merged;
        }
        logger.debug("generator", "Generator '" + entry.generator->getName() + "' produced " +
                     std::to_string(generated.size()) + " page(s)",
                     {{"generator_index", std::to_string(index)},
                      {"generator_total", std::to_string(generators_.size())}});
    }
    return merged;
}

PageCollection AliasRedirectGenerator::generate(const PageCollection& pages,
                                                const TaxonomyCollection& /*taxonomies*/,
                                                const SiteConfig& config) {
    PageCollection redirects;
    const std::string baseurl = config.getString("baseurl");

    for (const auto& page : pages) {
        auto it = page.variables.find("aliases");
        if (it == page.variables.end()) {
            continue;
        }

        std::vector<std::string> aliases;
        if (it->is_string()) {
            aliases.push_back(it->get<std::string>());
        } else if (it->is_array()) {
            for (const auto& alias : *it) {
                if (alias.is_string()) {
                    aliases.push_back(alias.get<std::string>());
                }
            }
        }

        for (const auto& alias : aliases) {
            const std::string id = slugifyPath(std::filesystem::path(alias).relative_path());
            if (id.empty() || id == page.id || pages.has(id) || redirects.has(id)) {
                continue;
            }

            std::string target = baseurl;
            if (!target.empty() && target.back() == '/') {
                target.pop_back();
            }
            target += pageUrl(page);

            Page redirect;
            redirect.id = id;
            redirect.type = PageType::REDIRECT;
            redirect.language = page.language;
            redirect.title = page.title;
            redirect.is_virtual = true;
            redirect.variables = {{"redirect", target}};
            redirect.content = "<!DOCTYPE html><html><head><meta charset=\"utf-8\">"
                               "<meta http-equiv=\"refresh\" content=\"0; url={{ page.redirect }}\">"
                               "<link rel=\"canonical\" href=\"{{ page.redirect }}\"></head></html>";
            redirects.add(std::move(redirect));
        }
    }

    return redirects;
}

} // namespace Content
} // namespace PSB
