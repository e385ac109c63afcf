// EN: Small helpers shared by the builder: formatting, trimming and memory sampling.
// FR: Petits utilitaires partagés par le builder : formatage, découpage et mesure mémoire.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace PSB {
namespace Orchestrator {
namespace PipelineUtils {

    // EN: Elapsed seconds rounded to two decimals ("1.25").
    // FR: Secondes écoulées arrondies à deux décimales ("1.25").
    std::string formatSeconds(std::chrono::steady_clock::duration duration);

    // EN: Human readable byte count ("512 B", "1.5 KB", "-2 MB").
    // FR: Taille lisible ("512 B", "1.5 KB", "-2 MB").
    std::string formatBytes(std::int64_t bytes);

    // EN: Strip the given characters from both ends.
    // FR: Retire les caractères donnés aux deux extrémités.
    std::string trim(const std::string& value, const std::string& characters = " \t\r\n\v\f");

    // EN: A base URL is usable in production when something remains once whitespace and slashes are stripped.
    // FR: Une URL de base est utilisable en production s'il reste quelque chose une fois espaces et slashs retirés.
    bool isProductionBaseUrl(const std::string& baseurl);

    // EN: Resident memory of the current process in bytes, 0 when unavailable.
    // FR: Mémoire résidente du processus courant en octets, 0 si indisponible.
    std::int64_t currentMemoryUsage();

} // namespace PipelineUtils
} // namespace Orchestrator
} // namespace PSB
