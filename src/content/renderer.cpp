#include "content/renderer.hpp"

#include <regex>

namespace PSB {
namespace Content {

namespace {

// EN: Walk a dotted path ("author.name") through a JSON object.
// FR: Parcourt un chemin pointé ("author.name") dans un objet JSON.
const nlohmann::json* lookup(const nlohmann::json& root, const std::string& path) {
    const nlohmann::json* node = &root;
    std::string::size_type start = 0;
    while (start <= path.size()) {
        const auto dot = path.find('.', start);
        const std::string key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(key);
        if (it == node->end()) {
            return nullptr;
        }
        node = &*it;
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return node;
}

std::string toText(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // namespace

std::string PlaceholderRenderer::render(const Page& page, const nlohmann::json& site) {
    nlohmann::json scope = {
        {"page", page.variables},
        {"site", site}
    };
    scope["page"]["id"] = page.id;
    scope["page"]["title"] = page.title;
    scope["page"]["language"] = page.language;
    scope["page"]["type"] = pageTypeToString(page.type);

    static const std::regex placeholder(R"(\{\{\s*([A-Za-z0-9_.]+)\s*\}\})");

    std::string result;
    auto begin = std::sregex_iterator(page.content.begin(), page.content.end(), placeholder);
    auto last = page.content.cbegin();
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        result.append(last, match[0].first);
        if (const nlohmann::json* value = lookup(scope, match[1].str())) {
            result += toText(*value);
        } else {
            // EN: Unknown placeholders are kept verbatim.
            // FR: Les substitutions inconnues sont conservées telles quelles.
            result.append(match[0].first, match[0].second);
        }
        last = match[0].second;
    }
    result.append(last, page.content.cend());
    return result;
}

} // namespace Content
} // namespace PSB
