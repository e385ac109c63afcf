#include "steps/builtin_steps.hpp"

namespace PSB {
namespace Steps {

// EN: Order matters: loading before creation, taxonomies before generators (which may
//     build pages from them), generated pages before menus, rendering before saving.
// FR: L'ordre compte : chargement avant création, taxonomies avant générateurs (qui peuvent
//     en dériver des pages), pages générées avant menus, rendu avant enregistrement.
std::vector<Orchestrator::StepSpec> defaultCatalogue() {
    return {
        Orchestrator::makeStepSpec<PagesLoad>("pages.load"),
        Orchestrator::makeStepSpec<DataLoad>("data.load"),
        Orchestrator::makeStepSpec<StaticLoad>("static.load"),
        Orchestrator::makeStepSpec<PagesCreate>("pages.create"),
        Orchestrator::makeStepSpec<TaxonomiesCreate>("taxonomies.create"),
        Orchestrator::makeStepSpec<PagesGenerate>("pages.generate"),
        Orchestrator::makeStepSpec<MenusCreate>("menus.create"),
        Orchestrator::makeStepSpec<StaticCopy>("static.copy"),
        Orchestrator::makeStepSpec<PagesRender>("pages.render"),
        Orchestrator::makeStepSpec<PagesSave>("pages.save"),
    };
}

} // namespace Steps
} // namespace PSB
