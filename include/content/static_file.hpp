// EN: Static file descriptors and the named data collection.
// FR: Descripteurs de fichiers statiques et collection de données nommées.

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace PSB {
namespace Content {

// EN: A file copied verbatim into the output.
// FR: Un fichier copié tel quel dans la sortie.
struct StaticFile {
    std::filesystem::path source_path;
    std::string output_path;        // EN: Destination-relative, forward slashes / FR: Relatif à la destination
    std::uintmax_t size = 0;
};

// EN: Output-relative path -> static file.
// FR: Chemin relatif de sortie -> fichier statique.
using StaticFileCollection = std::map<std::string, StaticFile>;

// EN: Dataset name ("authors", "nav/links") -> parsed content.
// FR: Nom de jeu de données ("authors", "nav/links") -> contenu parsé.
using DataCollection = std::map<std::string, nlohmann::json>;

} // namespace Content
} // namespace PSB
