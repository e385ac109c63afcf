// EN: Implementation of SiteConfig. Provides YAML parsing, dotted-key lookup and environment overrides.
// FR: Implémentation de SiteConfig. Fournit le parsing YAML, la recherche par clés pointées et les surcharges d'environnement.

#include "infrastructure/config/site_config.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <sstream>

extern char** environ;

namespace PSB {

namespace {

// EN: Parse a scalar the way YAML and environment values are typed: bool, int, double, then string.
// FR: Parse un scalaire comme les valeurs YAML et d'environnement : bool, int, double, puis chaîne.
ConfigValue parseScalar(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true") return ConfigValue(true);
    if (lower == "false") return ConfigValue(false);

    if (!text.empty()) {
        char* end = nullptr;
        long int_val = std::strtol(text.c_str(), &end, 10);
        if (end && *end == '\0' && text.find('.') == std::string::npos) {
            return ConfigValue(static_cast<int>(int_val));
        }
        double double_val = std::strtod(text.c_str(), &end);
        if (end && *end == '\0') {
            return ConfigValue(double_val);
        }
    }
    return ConfigValue(text);
}

} // namespace

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// EN: Built-in defaults; a loaded file only adds or replaces keys.
// FR: Valeurs par défaut intégrées ; un fichier chargé ne fait qu'ajouter ou remplacer des clés.
const std::unordered_map<std::string, ConfigValue>& SiteConfig::defaults() {
    static const std::unordered_map<std::string, ConfigValue> values = {
        {"title", ConfigValue(std::string())},
        {"baseurl", ConfigValue(std::string())},
        {"language", ConfigValue(std::string("en"))},
        {"languages", ConfigValue(std::vector<std::string>{"en"})},
        {"debug", ConfigValue(false)},
        {"pages.dir", ConfigValue(std::string("pages"))},
        {"pages.ext", ConfigValue(std::vector<std::string>{"md", "markdown", "html"})},
        {"data.dir", ConfigValue(std::string("data"))},
        {"data.enabled", ConfigValue(true)},
        {"data.ext", ConfigValue(std::vector<std::string>{"json", "yaml", "yml"})},
        {"static.dir", ConfigValue(std::string("static"))},
        {"output.dir", ConfigValue(std::string("_site"))},
        {"output.ext", ConfigValue(std::string("html"))},
        {"taxonomies", ConfigValue(std::vector<std::string>{"tags", "categories"})},
        {"menus.main.enabled", ConfigValue(true)},
    };
    return values;
}

SiteConfig::SiteConfig() : values_(defaults()) {
    setSourceDir(std::nullopt);
    setDestinationDir(std::nullopt);
}

SiteConfig::SiteConfig(const std::unordered_map<std::string, ConfigValue>& values) : SiteConfig() {
    for (const auto& [key, value] : values) {
        values_[key] = value;
    }
}

SiteConfig::SiteConfig(const SiteConfig& other) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    values_ = other.values_;
    source_dir_ = other.source_dir_;
    destination_dir_ = other.destination_dir_;
}

SiteConfig& SiteConfig::operator=(const SiteConfig& other) {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        values_ = other.values_;
        source_dir_ = other.source_dir_;
        destination_dir_ = other.destination_dir_;
    }
    return *this;
}

bool SiteConfig::loadFromFile(const std::string& filename) {
    try {
        if (!std::filesystem::exists(filename)) {
            LOG_ERROR("config", "Configuration file not found: " + filename);
            return false;
        }

        YAML::Node yaml = YAML::LoadFile(filename);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            loadNode(yaml, "");
        }

        LOG_INFO("config", "Configuration loaded from: " + filename);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool SiteConfig::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        if (!yaml.IsNull() && !yaml.IsMap()) {
            LOG_ERROR("config", "Configuration root must be a mapping");
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            loadNode(yaml, "");
        }

        LOG_DEBUG("config", "Configuration loaded from string");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

// EN: Flatten nested mappings into dotted keys.
// FR: Aplatit les mappings imbriqués en clés pointées.
void SiteConfig::loadNode(const YAML::Node& node, const std::string& prefix) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto& item : node) {
        const std::string key = prefix.empty()
            ? item.first.as<std::string>()
            : prefix + "." + item.first.as<std::string>();
        if (item.second.IsMap()) {
            loadNode(item.second, key);
        } else if (!item.second.IsNull()) {
            values_[key] = parseYamlValue(item.second);
        }
    }
}

ConfigValue SiteConfig::parseYamlValue(const YAML::Node& node) const {
    if (node.IsScalar()) {
        const std::string text = node.as<std::string>();
        // EN: Quoted scalars stay strings.
        // FR: Les scalaires entre guillemets restent des chaînes.
        if (node.Tag() == "!") {
            return ConfigValue(expandVariables(text));
        }
        ConfigValue value = parseScalar(text);
        if (auto str = value.tryAs<std::string>()) {
            return ConfigValue(expandVariables(*str));
        }
        return value;
    }

    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            if (item.IsScalar()) {
                array_value.push_back(expandVariables(item.as<std::string>()));
            } else {
                array_value.push_back(YAML::Dump(item));
            }
        }
        return ConfigValue(array_value);
    }

    return ConfigValue(YAML::Dump(node));
}

void SiteConfig::loadEnvironmentOverrides(const std::string& prefix) {
    std::vector<std::pair<std::string, std::string>> overrides;
    for (char** env = environ; env && *env; ++env) {
        const std::string entry(*env);
        const auto eq = entry.find('=');
        if (eq == std::string::npos || entry.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        std::string key = entry.substr(prefix.size(), eq - prefix.size());
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::string::size_type pos = 0;
        while ((pos = key.find("__", pos)) != std::string::npos) {
            key.replace(pos, 2, ".");
            ++pos;
        }
        if (!key.empty()) {
            overrides.emplace_back(key, entry.substr(eq + 1));
        }
    }

    for (const auto& [key, raw] : overrides) {
        set(key, parseScalar(raw));
        LOG_DEBUG("config", "Environment override applied: " + key);
    }
}

ConfigValue SiteConfig::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

void SiteConfig::set(const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

bool SiteConfig::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.find(key) != values_.end();
}

void SiteConfig::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(key);
}

std::vector<std::string> SiteConfig::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

void SiteConfig::merge(const SiteConfig& other, bool overwrite) {
    if (this == &other) {
        return;
    }
    std::scoped_lock lock(mutex_, other.mutex_);
    for (const auto& [key, value] : other.values_) {
        if (overwrite || values_.find(key) == values_.end()) {
            values_[key] = value;
        }
    }
}

std::string SiteConfig::getString(const std::string& key, const std::string& default_value) const {
    ConfigValue value = get(key);
    if (!value.isValid()) {
        return default_value;
    }
    if (auto str = value.tryAs<std::string>()) {
        return *str;
    }
    return value.toString();
}

bool SiteConfig::getBool(const std::string& key, bool default_value) const {
    ConfigValue value = get(key);
    if (auto flag = value.tryAs<bool>()) {
        return *flag;
    }
    if (auto number = value.tryAs<int>()) {
        return *number != 0;
    }
    if (auto str = value.tryAs<std::string>()) {
        return *str == "true" || *str == "1" || *str == "yes";
    }
    return default_value;
}

std::vector<std::string> SiteConfig::getList(const std::string& key) const {
    ConfigValue value = get(key);
    if (auto list = value.tryAs<std::vector<std::string>>()) {
        return *list;
    }
    if (auto str = value.tryAs<std::string>()) {
        return str->empty() ? std::vector<std::string>{} : std::vector<std::string>{*str};
    }
    return {};
}

void SiteConfig::setSourceDir(const std::optional<std::filesystem::path>& source_dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!source_dir || source_dir->empty()) {
        source_dir_ = std::filesystem::current_path();
    } else {
        source_dir_ = *source_dir;
    }
}

void SiteConfig::setDestinationDir(const std::optional<std::filesystem::path>& destination_dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!destination_dir || destination_dir->empty()) {
        destination_dir_ = source_dir_;
    } else {
        destination_dir_ = *destination_dir;
    }
}

std::filesystem::path SiteConfig::getSourcePath(const std::string& dir_key) const {
    const std::string dir = getString(dir_key);
    std::lock_guard<std::mutex> lock(mutex_);
    return dir.empty() ? source_dir_ : source_dir_ / dir;
}

std::string SiteConfig::dump() const {
    std::ostringstream oss;
    for (const std::string& key : keys()) {
        oss << key << " = " << get(key).toString() << "\n";
    }
    return oss.str();
}

std::string SiteConfig::expandVariables(const std::string& value) const {
    static const std::regex var_regex(R"(\$\{([^}]+)\})");
    std::string result;
    result.reserve(value.size());

    // EN: Single forward scan: substituted text is never rescanned, unknown variables stay as-is.
    // FR: Un seul parcours : le texte substitué n'est jamais relu, les variables inconnues restent telles quelles.
    auto begin = value.cbegin();
    std::smatch match;
    while (std::regex_search(begin, value.cend(), match, var_regex)) {
        result.append(begin, match[0].first);
        const char* env_value = std::getenv(match[1].str().c_str());
        if (env_value) {
            result += env_value;
        } else {
            result.append(match[0].first, match[0].second);
        }
        begin = match[0].second;
    }
    result.append(begin, value.cend());

    return result;
}

} // namespace PSB
