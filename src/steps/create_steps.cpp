// EN: Steps that build the page model: pages, virtual pages, taxonomies and menus.
// FR: Étapes qui construisent le modèle de pages : pages, pages virtuelles, taxonomies et menus.

#include "steps/builtin_steps.hpp"
#include "steps/step_helpers.hpp"
#include "infrastructure/system/build_errors.hpp"
#include "orchestrator/builder.hpp"

#include <map>
#include <system_error>

namespace PSB {
namespace Steps {

namespace {

std::vector<std::string> stringList(const nlohmann::json& value) {
    std::vector<std::string> list;
    if (value.is_string()) {
        list.push_back(value.get<std::string>());
    } else if (value.is_array()) {
        for (const auto& item : value) {
            if (item.is_string()) {
                list.push_back(item.get<std::string>());
            }
        }
    }
    return list;
}

Content::Page makePage(const std::filesystem::path& file, const std::filesystem::path& pages_dir,
                       const SiteConfig& config) {
    const std::filesystem::path relative = file.lexically_relative(pages_dir);

    FrontMatter front_matter;
    try {
        front_matter = parseFrontMatter(readTextFile(file));
    } catch (const BuildError& e) {
        throw BuildError(relative.generic_string() + ": " + e.what());
    }

    Content::Page page;
    page.id = Content::slugifyPath(relative);
    page.source_path = file;
    page.content = std::move(front_matter.body);
    page.variables = std::move(front_matter.variables);

    // EN: "index" files stand for their folder.
    // FR: Les fichiers "index" représentent leur dossier.
    const std::string index_suffix = "/index";
    if (page.id == "index") {
        page.type = Content::PageType::HOMEPAGE;
    } else if (page.id.size() > index_suffix.size() &&
               page.id.compare(page.id.size() - index_suffix.size(), index_suffix.size(), index_suffix) == 0) {
        page.id.erase(page.id.size() - index_suffix.size());
        page.type = Content::PageType::SECTION;
    }

    const auto slash = page.id.find('/');
    if (page.type == Content::PageType::SECTION || slash != std::string::npos) {
        page.section = page.id.substr(0, slash);
    }

    page.title = page.getVariable<std::string>("title", relative.stem().string());
    page.draft = page.getVariable<bool>("draft", false);
    page.language = page.getVariable<std::string>("language", config.getString("language", "en"));
    page.output_path = outputPathFor(page, config.getString("output.ext", "html"));
    return page;
}

} // namespace

void PagesCreate::init(const BuildOptions& options) {
    AbstractStep::init(options);
    std::error_code ec;
    can_process_ = std::filesystem::is_directory(config_.getSourcePath("pages.dir"), ec);
}

void PagesCreate::process() {
    const auto pages_dir = config_.getSourcePath("pages.dir");
    Content::PageCollection pages;
    std::size_t drafts = 0;

    for (const auto& file : builder_.getPagesFiles()) {
        Content::Page page = makePage(file, pages_dir, config_);

        if (page.draft && !options_.includeDrafts()) {
            ++drafts;
            continue;
        }
        if (pages.has(page.id)) {
            logger_.warn("pages.create", "Page '" + page.id + "' already exists, ignoring '" +
                                             file.lexically_relative(pages_dir).generic_string() + "'");
            continue;
        }
        pages.add(std::move(page));
    }

    logger_.info("pages.create", std::to_string(pages.size()) + " page(s) created",
                 {{"drafts_skipped", std::to_string(drafts)}});
    builder_.setPages(std::move(pages));
}

void PagesGenerate::init(const BuildOptions& options) {
    AbstractStep::init(options);
    can_process_ = !builder_.getContext().getGeneratorManager().empty();
}

void PagesGenerate::process() {
    auto& context = builder_.getContext();
    auto& pages = context.getPages();
    const std::string extension = config_.getString("output.ext", "html");

    const std::size_t merged =
        context.getGeneratorManager().process(pages, context.getTaxonomies(), config_, logger_);
    for (auto& page : pages) {
        if (page.is_virtual && page.output_path.empty()) {
            page.output_path = outputPathFor(page, extension);
        }
    }

    logger_.info("pages.generate", std::to_string(merged) + " virtual page(s) generated");
}

void TaxonomiesCreate::init(const BuildOptions& options) {
    AbstractStep::init(options);
    can_process_ = !config_.getList("taxonomies").empty();
}

void TaxonomiesCreate::process() {
    Content::TaxonomyCollection taxonomies;
    const auto vocabularies = config_.getList("taxonomies");

    for (const auto& plural : vocabularies) {
        auto& vocabulary = taxonomies.getOrCreate(plural);
        for (const auto& page : builder_.getPages()) {
            auto it = page.variables.find(plural);
            if (it == page.variables.end()) {
                continue;
            }
            for (const auto& term : stringList(*it)) {
                vocabulary.tag(term, page.id);
            }
        }
        logger_.debug("taxonomies.create", plural + ": " + std::to_string(vocabulary.size()) + " term(s)");
    }

    builder_.setTaxonomies(std::move(taxonomies));
}

void MenusCreate::init(const BuildOptions& options) {
    AbstractStep::init(options);
    can_process_ = config_.getBool("menus.main.enabled", true);
}

void MenusCreate::process() {
    std::map<std::string, Content::MenuCollection> menus;
    for (const auto& language : config_.getList("languages")) {
        menus[language];
    }
    menus[config_.getString("language", "en")];

    for (const auto& page : builder_.getPages()) {
        auto it = page.variables.find("menu");
        if (it == page.variables.end()) {
            continue;
        }

        std::map<std::string, int> targets;
        if (it->is_object()) {
            for (const auto& item : it->items()) {
                const auto& properties = item.value();
                int weight = 0;
                if (properties.is_object() && properties.contains("weight") &&
                    properties["weight"].is_number_integer()) {
                    weight = properties["weight"].get<int>();
                }
                targets[item.key()] = weight;
            }
        } else {
            for (const auto& name : stringList(*it)) {
                targets[name] = page.getVariable<int>("weight", 0);
            }
        }

        auto& collection = menus[page.language];
        for (const auto& [name, weight] : targets) {
            Content::MenuEntry entry;
            entry.id = page.id;
            entry.name = page.title;
            entry.url = Content::pageUrl(page);
            entry.page_id = page.id;
            entry.weight = weight;
            collection.getOrCreate(name).add(std::move(entry));
        }
    }

    std::size_t entries = 0;
    for (auto& [language, collection] : menus) {
        std::vector<std::string> names;
        for (const auto& menu : collection.menus()) {
            names.push_back(menu.getName());
        }
        for (const auto& name : names) {
            auto& menu = collection.getOrCreate(name);
            menu.sort();
            entries += menu.size();
        }
    }

    logger_.info("menus.create", std::to_string(entries) + " menu entry(ies) created");
    builder_.setMenus(std::move(menus));
}

} // namespace Steps
} // namespace PSB
