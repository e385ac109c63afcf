// EN: Parsing and path helpers shared by the built-in steps.
// FR: Utilitaires d'analyse et de chemins partagés par les étapes intégrées.

#pragma once

#include "content/page.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace YAML { class Node; }

namespace PSB {
namespace Steps {

// EN: Front matter and body of a content file.
// FR: Front matter et corps d'un fichier de contenu.
struct FrontMatter {
    nlohmann::json variables = nlohmann::json::object();
    std::string body;
};

// EN: Split a leading "---" YAML block from the body. Throws BuildError on invalid YAML
//     or when the block is not a mapping.
// FR: Sépare un bloc YAML "---" initial du corps. Lance BuildError si le YAML est invalide
//     ou si le bloc n'est pas un dictionnaire.
FrontMatter parseFrontMatter(const std::string& text);

// EN: Convert a YAML node to JSON. Unquoted scalars become numbers or booleans when they parse as such.
// FR: Convertit un noeud YAML en JSON. Les scalaires non quotés deviennent nombres ou booléens si possible.
nlohmann::json yamlToJson(const YAML::Node& node);

// EN: Regular files under `root`, recursively, sorted, optionally restricted to extensions (without dot).
// FR: Fichiers réguliers sous `root`, récursivement, triés, éventuellement limités à des extensions (sans point).
std::vector<std::filesystem::path> listFiles(const std::filesystem::path& root,
                                             const std::vector<std::string>& extensions = {});

bool hasExtension(const std::filesystem::path& file, const std::vector<std::string>& extensions);

// EN: Destination-relative file of a page: "index.html" for the homepage, "<id>/index.html" otherwise.
// FR: Fichier relatif à la destination : "index.html" pour l'accueil, "<id>/index.html" sinon.
std::string outputPathFor(const Content::Page& page, const std::string& extension);

std::string readTextFile(const std::filesystem::path& file);
void writeTextFile(const std::filesystem::path& file, const std::string& content);

} // namespace Steps
} // namespace PSB
