// EN: Built-in build steps and the default catalogue, in dependency order.
// FR: Étapes de build intégrées et catalogue par défaut, dans l'ordre des dépendances.

#pragma once

#include "orchestrator/step.hpp"

#include <string>
#include <vector>

namespace PSB {
namespace Steps {

using Orchestrator::AbstractStep;
using Orchestrator::Builder;
using Orchestrator::BuildOptions;

// EN: Load steps. They reset the collection they fill before filling it.
// FR: Étapes de chargement. Elles vident la collection qu'elles remplissent avant de la remplir.

// EN: Lists the content files of "pages.dir", honouring the "page" option.
// FR: Liste les fichiers de contenu de "pages.dir", en respectant l'option "page".
class PagesLoad : public AbstractStep {
public:
    using AbstractStep::AbstractStep;
    std::string getName() const override { return "Loading pages"; }
    void init(const BuildOptions& options) override;
    void process() override;
};

class DataLoad : public AbstractStep {
public:
    using AbstractStep::AbstractStep;
    std::string getName() const override { return "Loading data"; }
    void init(const BuildOptions& options) override;
    void process() override;
};

class StaticLoad : public AbstractStep {
public:
    using AbstractStep::AbstractStep;
    std::string getName() const override { return "Loading static files"; }
    void init(const BuildOptions& options) override;
    void process() override;
};

// EN: Turns the listed files into pages (front matter, type, language, output path). Drafts are
//     skipped unless the "drafts" option is set.
// FR: Transforme les fichiers listés en pages (front matter, type, langue, chemin de sortie). Les
//     brouillons sont ignorés sauf si l'option "drafts" est active.
class PagesCreate : public AbstractStep {
public:
    using AbstractStep::AbstractStep;
    std::string getName() const override { return "Creating pages"; }
    void init(const BuildOptions& options) override;
    void process() override;
};

class PagesGenerate : public AbstractStep {
public:
    using AbstractStep::AbstractStep;
    std::string getName() const override { return "Generating virtual pages"; }
    void init(const BuildOptions& options) override;
    void process() override;
};

// EN: Rebuilds the vocabularies listed under "taxonomies" from the page variables of the same name.
// FR: Reconstruit les vocabulaires listés sous "taxonomies" depuis les variables de page du même nom.
class TaxonomiesCreate : public AbstractStep {
public:
    using AbstractStep::AbstractStep;
    std::string getName() const override { return "Creating taxonomies"; }
    void init(const BuildOptions& options) override;
    void process() override;
};

// EN: Rebuilds per-language menus from the "menu" page variable ("main", ["main", "footer"]
//     or {main: {weight: 10}}).
// FR: Reconstruit les menus par langue depuis la variable de page "menu" ("main", ["main", "footer"]
//     ou {main: {weight: 10}}).
class MenusCreate : public AbstractStep {
public:
    using AbstractStep::AbstractStep;
    std::string getName() const override { return "Creating menus"; }
    void init(const BuildOptions& options) override;
    void process() override;
};

class StaticCopy : public AbstractStep {
public:
    using AbstractStep::AbstractStep;
    std::string getName() const override { return "Copying static files"; }
    void init(const BuildOptions& options) override;
    void process() override;
};

class PagesRender : public AbstractStep {
public:
    using AbstractStep::AbstractStep;
    std::string getName() const override { return "Rendering pages"; }
    void process() override;
};

class PagesSave : public AbstractStep {
public:
    using AbstractStep::AbstractStep;
    std::string getName() const override { return "Saving pages"; }
    void init(const BuildOptions& options) override;
    void process() override;
};

// EN: The ten built-in steps, from loading to saving.
// FR: Les dix étapes intégrées, du chargement à l'enregistrement.
std::vector<Orchestrator::StepSpec> defaultCatalogue();

} // namespace Steps
} // namespace PSB
