#include "steps/step_helpers.hpp"
#include "infrastructure/system/build_errors.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace PSB {
namespace Steps {

namespace {

bool isDelimiter(const std::string& line) {
    std::string trimmed = line;
    while (!trimmed.empty() && (trimmed.back() == '\r' || trimmed.back() == ' ' || trimmed.back() == '\t')) {
        trimmed.pop_back();
    }
    return trimmed == "---" || trimmed == "...";
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

FrontMatter parseFrontMatter(const std::string& text) {
    FrontMatter result;

    std::istringstream stream(text);
    std::string line;
    if (!std::getline(stream, line) || !isDelimiter(line) || line.rfind("---", 0) != 0) {
        result.body = text;
        return result;
    }

    std::string yaml;
    bool closed = false;
    while (std::getline(stream, line)) {
        if (isDelimiter(line)) {
            closed = true;
            break;
        }
        yaml += line + "\n";
    }
    if (!closed) {
        // EN: An unterminated block is plain content.
        // FR: Un bloc non terminé est du contenu ordinaire.
        result.body = text;
        return result;
    }

    std::ostringstream body;
    body << stream.rdbuf();
    result.body = body.str();

    YAML::Node node;
    try {
        node = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw BuildError("Invalid front matter: " + std::string(e.what()));
    }

    if (node.IsNull()) {
        return result;
    }
    if (!node.IsMap()) {
        throw BuildError("Front matter must be a mapping");
    }
    result.variables = yamlToJson(node);
    return result;
}

nlohmann::json yamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;

        case YAML::NodeType::Scalar: {
            const std::string& raw = node.Scalar();
            // EN: Quoted scalars carry the "!" tag and stay strings.
            // FR: Les scalaires quotés portent le tag "!" et restent des chaînes.
            if (node.Tag() == "!") {
                return raw;
            }
            long long integer = 0;
            if (YAML::convert<long long>::decode(node, integer)) {
                return integer;
            }
            double number = 0.0;
            if (YAML::convert<double>::decode(node, number)) {
                return number;
            }
            bool flag = false;
            if (YAML::convert<bool>::decode(node, flag)) {
                return flag;
            }
            return raw;
        }

        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(yamlToJson(item));
            }
            return array;
        }

        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& item : node) {
                object[item.first.as<std::string>()] = yamlToJson(item.second);
            }
            return object;
        }
    }
    return nullptr;
}

std::vector<std::filesystem::path> listFiles(const std::filesystem::path& root,
                                             const std::vector<std::string>& extensions) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return files;
    }

    for (auto it = std::filesystem::recursive_directory_iterator(root, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        if (extensions.empty() || hasExtension(it->path(), extensions)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw BuildError("Unable to scan '" + root.string() + "': " + ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

bool hasExtension(const std::filesystem::path& file, const std::vector<std::string>& extensions) {
    std::string ext = file.extension().string();
    if (ext.empty()) {
        return false;
    }
    ext = toLower(ext.substr(1));
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

std::string outputPathFor(const Content::Page& page, const std::string& extension) {
    const std::string ext = extension.empty() ? "html" : extension;
    if (page.type == Content::PageType::HOMEPAGE || page.id.empty() || page.id == "index") {
        return "index." + ext;
    }
    return page.id + "/index." + ext;
}

std::string readTextFile(const std::filesystem::path& file) {
    std::ifstream input(file, std::ios::binary);
    if (!input.is_open()) {
        throw BuildError("Unable to read '" + file.string() + "'");
    }
    std::ostringstream content;
    content << input.rdbuf();
    return content.str();
}

void writeTextFile(const std::filesystem::path& file, const std::string& content) {
    std::error_code ec;
    std::filesystem::create_directories(file.parent_path(), ec);
    if (ec) {
        throw BuildError("Unable to create '" + file.parent_path().string() + "': " + ec.message());
    }
    std::ofstream output(file, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw BuildError("Unable to write '" + file.string() + "'");
    }
    output << content;
    if (!output) {
        throw BuildError("Unable to write '" + file.string() + "'");
    }
}

} // namespace Steps
} // namespace PSB
