// EN: Template rendering boundary and the built-in placeholder renderer.
// FR: Frontière de rendu de templates et moteur de substitution intégré.

#pragma once

#include "content/page.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace PSB {
namespace Content {

// EN: Interface implemented by template engines plugged into the render step.
// FR: Interface implémentée par les moteurs de templates branchés sur l'étape de rendu.
class RendererInterface {
public:
    virtual ~RendererInterface() = default;

    virtual std::string getName() const = 0;

    // EN: Render one page. `site` carries site-wide variables (title, baseurl, data, menus).
    // FR: Rend une page. `site` porte les variables globales (title, baseurl, data, menus).
    virtual std::string render(const Page& page, const nlohmann::json& site) = 0;
};

// EN: Renderer used when no template engine is installed: substitutes {{ page.x }} and {{ site.x }}.
// FR: Moteur utilisé sans moteur de templates : substitue {{ page.x }} et {{ site.x }}.
class PlaceholderRenderer : public RendererInterface {
public:
    std::string getName() const override { return "placeholder"; }
    std::string render(const Page& page, const nlohmann::json& site) override;
};

} // namespace Content
} // namespace PSB
