// EN: Site configuration backed by YAML, with dotted keys, defaults and environment overrides.
// FR: Configuration du site basée sur YAML, avec clés pointées, valeurs par défaut et surcharges d'environnement.

#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace PSB {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(ValueType(value)) {}

    ConfigValue(const char* value) : value_(ValueType(std::string(value))) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const;

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const;

    template<typename T>
    T asOrDefault(const T& default_value) const;

    bool isValid() const { return value_.has_value(); }

    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration of one site. Keys are dotted paths ("pages.dir"); top-level keys have no dot.
// FR: Configuration d'un site. Les clés sont des chemins pointés ("pages.dir"); les clés racines n'ont pas de point.
class SiteConfig {
public:
    // EN: Build a configuration seeded with the built-in defaults.
    // FR: Construit une configuration initialisée avec les valeurs par défaut intégrées.
    SiteConfig();
    explicit SiteConfig(const std::unordered_map<std::string, ConfigValue>& values);

    SiteConfig(const SiteConfig& other);
    SiteConfig& operator=(const SiteConfig& other);

    // EN: Merge a YAML file on top of the current values. Returns false and logs on error.
    // FR: Fusionne un fichier YAML sur les valeurs actuelles. Retourne false et logue en cas d'erreur.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    // EN: Apply PAPYRUS_* environment variables (PAPYRUS_BASEURL -> baseurl, PAPYRUS_PAGES__DIR -> pages.dir).
    // FR: Applique les variables PAPYRUS_* (PAPYRUS_BASEURL -> baseurl, PAPYRUS_PAGES__DIR -> pages.dir).
    void loadEnvironmentOverrides(const std::string& prefix = "PAPYRUS_");

    ConfigValue get(const std::string& key) const;
    void set(const std::string& key, const ConfigValue& value);
    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys() const;

    // EN: Merge another configuration into this one.
    // FR: Fusionne une autre configuration dans celle-ci.
    void merge(const SiteConfig& other, bool overwrite = true);

    std::string getString(const std::string& key, const std::string& default_value = "") const;
    bool getBool(const std::string& key, bool default_value = false) const;
    std::vector<std::string> getList(const std::string& key) const;

    // EN: Source and destination directories. A null/empty argument resets to the default.
    // FR: Répertoires source et destination. Un argument vide rétablit la valeur par défaut.
    void setSourceDir(const std::optional<std::filesystem::path>& source_dir);
    void setDestinationDir(const std::optional<std::filesystem::path>& destination_dir);
    const std::filesystem::path& getSourceDir() const { return source_dir_; }
    const std::filesystem::path& getDestinationDir() const { return destination_dir_; }

    // EN: Resolve a configured sub-directory ("pages.dir", "data.dir", ...) against the source directory.
    // FR: Résout un sous-répertoire configuré ("pages.dir", "data.dir", ...) par rapport au répertoire source.
    std::filesystem::path getSourcePath(const std::string& dir_key) const;

    std::string dump() const;

    static const std::unordered_map<std::string, ConfigValue>& defaults();

private:
    void loadNode(const YAML::Node& node, const std::string& prefix);
    ConfigValue parseYamlValue(const YAML::Node& node) const;
    std::string expandVariables(const std::string& value) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigValue> values_;
    std::filesystem::path source_dir_;
    std::filesystem::path destination_dir_;
};

template<typename T>
T ConfigValue::as() const {
    if (!value_) {
        throw std::runtime_error("ConfigValue is empty");
    }
    if (const T* value = std::get_if<T>(&*value_)) {
        return *value;
    }
    throw std::runtime_error("ConfigValue type mismatch");
}

template<typename T>
std::optional<T> ConfigValue::tryAs() const {
    if (!value_) {
        return std::nullopt;
    }
    if (const T* value = std::get_if<T>(&*value_)) {
        return *value;
    }
    return std::nullopt;
}

template<typename T>
T ConfigValue::asOrDefault(const T& default_value) const {
    auto result = tryAs<T>();
    return result ? *result : default_value;
}

} // namespace PSB
