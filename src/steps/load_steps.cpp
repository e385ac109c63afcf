// EN: Steps that scan the source directory: pages, data files and static files.
// FR: Étapes qui parcourent le répertoire source : pages, fichiers de données et fichiers statiques.

#include "steps/builtin_steps.hpp"
#include "steps/step_helpers.hpp"
#include "infrastructure/system/build_errors.hpp"
#include "orchestrator/builder.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <system_error>

namespace PSB {
namespace Steps {

namespace {

bool isDirectory(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

// EN: "page" option matches a path relative to the pages directory, with or without extension.
// FR: L'option "page" désigne un chemin relatif au répertoire des pages, avec ou sans extension.
bool matchesPageFilter(const std::filesystem::path& relative, const std::string& filter) {
    const std::string generic = relative.generic_string();
    if (generic == filter) {
        return true;
    }
    std::filesystem::path without_ext = relative;
    without_ext.replace_extension();
    return without_ext.generic_string() == filter || Content::slugifyPath(relative) == filter;
}

} // namespace

void PagesLoad::init(const BuildOptions& options) {
    AbstractStep::init(options);
    can_process_ = isDirectory(config_.getSourcePath("pages.dir"));
}

void PagesLoad::process() {
    const auto pages_dir = config_.getSourcePath("pages.dir");
    auto files = listFiles(pages_dir, config_.getList("pages.ext"));

    if (options_.hasPageFilter()) {
        std::vector<std::filesystem::path> selected;
        for (const auto& file : files) {
            if (matchesPageFilter(file.lexically_relative(pages_dir), options_.pageFilter())) {
                selected.push_back(file);
            }
        }
        if (selected.empty()) {
            throw BuildError("Page '" + options_.pageFilter() + "' not found in '" + pages_dir.string() + "'");
        }
        files = std::move(selected);
    }

    logger_.info("pages.load", std::to_string(files.size()) + " file(s) found",
                 {{"dir", pages_dir.string()}});
    builder_.setPagesFiles(std::move(files));
}

void DataLoad::init(const BuildOptions& options) {
    AbstractStep::init(options);
    can_process_ = config_.getBool("data.enabled", true) && isDirectory(config_.getSourcePath("data.dir"));
}

void DataLoad::process() {
    const auto data_dir = config_.getSourcePath("data.dir");
    Content::DataCollection data;

    for (const auto& file : listFiles(data_dir, config_.getList("data.ext"))) {
        std::filesystem::path key = file.lexically_relative(data_dir);
        key.replace_extension();
        const std::string content = readTextFile(file);
        if (data.count(key.generic_string()) > 0) {
            logger_.warn("data.load", "Dataset '" + key.generic_string() + "' defined twice, keeping the last file",
                         {{"file", file.string()}});
        }

        try {
            if (hasExtension(file, {"json"})) {
                data[key.generic_string()] = nlohmann::json::parse(content);
            } else {
                data[key.generic_string()] = yamlToJson(YAML::Load(content));
            }
        } catch (const nlohmann::json::exception& e) {
            throw BuildError("Unable to parse data file '" + file.string() + "': " + e.what());
        } catch (const YAML::Exception& e) {
            throw BuildError("Unable to parse data file '" + file.string() + "': " + e.what());
        }

        logger_.debug("data.load", "Loaded " + key.generic_string(), {{"file", file.string()}});
    }

    logger_.info("data.load", std::to_string(data.size()) + " dataset(s) loaded");
    builder_.setData(std::move(data));
}

void StaticLoad::init(const BuildOptions& options) {
    AbstractStep::init(options);
    can_process_ = isDirectory(config_.getSourcePath("static.dir"));
}

void StaticLoad::process() {
    const auto static_dir = config_.getSourcePath("static.dir");
    Content::StaticFileCollection files;

    for (const auto& file : listFiles(static_dir)) {
        Content::StaticFile entry;
        entry.source_path = file;
        entry.output_path = file.lexically_relative(static_dir).generic_string();
        std::error_code ec;
        entry.size = std::filesystem::file_size(file, ec);
        if (ec) {
            entry.size = 0;
        }
        files.emplace(entry.output_path, std::move(entry));
    }

    logger_.info("static.load", std::to_string(files.size()) + " file(s) found");
    builder_.setStatic(std::move(files));
}

} // namespace Steps
} // namespace PSB
