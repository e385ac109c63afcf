#include "orchestrator/build_context.hpp"
#include "infrastructure/system/build_errors.hpp"

#include <cstdlib>

namespace PSB {
namespace Orchestrator {

BuildContext::BuildContext(std::shared_ptr<SiteConfig> config, std::shared_ptr<Logger> logger)
    : config_(config ? std::move(config) : std::make_shared<SiteConfig>()),
      logger_(logger ? std::move(logger) : std::make_shared<Logger>()) {
    debug_ = resolveDebug(*config_);
}

bool BuildContext::resolveDebug(const SiteConfig& config) {
    const char* env_value = std::getenv(kDebugEnvironmentVariable);
    if (env_value && std::string(env_value) == "true") {
        return true;
    }
    return config.getBool("debug", false);
}

void BuildContext::setConfig(std::shared_ptr<SiteConfig> config) {
    if (!config) {
        throw BuildError("Configuration handle cannot be null");
    }
    config_ = std::move(config);
}

void BuildContext::setLogger(std::shared_ptr<Logger> logger) {
    if (!logger) {
        throw BuildError("Logger handle cannot be null");
    }
    logger_ = std::move(logger);
}

const Content::MenuCollection& BuildContext::getMenus(const std::string& language) const {
    auto it = menus_.find(language);
    if (it == menus_.end()) {
        throw CollectionError("No menus for language '" + language + "'");
    }
    return it->second;
}

Content::RendererInterface& BuildContext::getRenderer() const {
    if (!renderer_) {
        throw BuildError("No renderer has been installed");
    }
    return *renderer_;
}

bool BuildContext::removePage(const std::string& page_id) {
    if (!pages_.has(page_id)) {
        return false;
    }
    for (auto& [_, menus] : menus_) {
        menus.removeReferencesTo(page_id);
    }
    taxonomies_.removeReferencesTo(page_id);
    return pages_.remove(page_id);
}

} // namespace Orchestrator
} // namespace PSB
