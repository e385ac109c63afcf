#include "orchestrator/build_options.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace PSB {
namespace Orchestrator {

namespace {

std::optional<bool> toBool(const ConfigValue& value) {
    if (auto flag = value.tryAs<bool>()) {
        return flag;
    }
    if (auto number = value.tryAs<int>()) {
        return *number != 0;
    }
    if (auto text = value.tryAs<std::string>()) {
        std::string lower = *text;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "1" || lower == "yes") return true;
        if (lower == "false" || lower == "0" || lower == "no" || lower.empty()) return false;
    }
    return std::nullopt;
}

} // namespace

BuildOptions BuildOptions::resolve(const BuildOptionMap& overrides, Logger* logger) {
    BuildOptions options;
    Logger& log = logger ? *logger : Logger::getInstance();

    for (const auto& [key, value] : overrides) {
        if (key == kDrafts || key == kDryRun) {
            auto flag = toBool(value);
            if (!flag) {
                log.debug("options", "Ignoring non-boolean value for '" + key + "': " + value.toString(),
                          {{"option", key}});
                continue;
            }
            (key == kDrafts ? options.include_drafts_ : options.dry_run_) = *flag;
        } else if (key == kPage) {
            if (!value.isValid()) {
                continue;
            }
            auto text = value.tryAs<std::string>();
            options.page_filter_ = text ? *text : value.toString();
        } else {
            options.extras_[key] = value;
        }
    }

    return options;
}

ConfigValue BuildOptions::get(const std::string& key) const {
    if (key == kDrafts) return ConfigValue(include_drafts_);
    if (key == kDryRun) return ConfigValue(dry_run_);
    if (key == kPage) return ConfigValue(page_filter_);

    auto it = extras_.find(key);
    return it != extras_.end() ? it->second : ConfigValue();
}

BuildOptionMap BuildOptions::toMap() const {
    BuildOptionMap all = extras_;
    all[kDrafts] = ConfigValue(include_drafts_);
    all[kDryRun] = ConfigValue(dry_run_);
    all[kPage] = ConfigValue(page_filter_);
    return all;
}

} // namespace Orchestrator
} // namespace PSB
