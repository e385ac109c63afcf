// EN: Page model and the ordered, id-unique page collection.
// FR: Modèle de page et collection de pages ordonnée à identifiants uniques.

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace PSB {
namespace Content {

// EN: Kind of page, used by menus and generators.
// FR: Type de page, utilisé par les menus et les générateurs.
enum class PageType {
    PAGE,        // EN: Regular content page / FR: Page de contenu classique
    HOMEPAGE,    // EN: Site root / FR: Racine du site
    SECTION,     // EN: Section index / FR: Index de section
    VOCABULARY,  // EN: Taxonomy listing / FR: Liste de taxonomie
    TERM,        // EN: Single taxonomy term / FR: Terme de taxonomie
    REDIRECT     // EN: Generated redirection / FR: Redirection générée
};

// EN: A page of the site. Loaded from a file or created by a generator (virtual).
// FR: Une page du site. Chargée depuis un fichier ou créée par un générateur (virtuelle).
struct Page {
    std::string id;                       // EN: Output path without extension ("blog/post-1") / FR: Chemin de sortie sans extension
    PageType type = PageType::PAGE;
    std::string language = "en";
    std::string section;                  // EN: First path segment / FR: Premier segment du chemin
    std::string title;
    bool draft = false;
    bool is_virtual = false;
    std::filesystem::path source_path;    // EN: Empty for virtual pages / FR: Vide pour les pages virtuelles
    std::string content;                  // EN: Raw file content, front matter removed / FR: Contenu brut sans front matter
    nlohmann::json variables = nlohmann::json::object(); // EN: Front matter / FR: Front matter
    std::string output;                   // EN: Rendered output / FR: Sortie rendue
    std::string output_path;              // EN: Destination-relative file path / FR: Chemin relatif à la destination

    // EN: Read a front matter variable, or a default when absent.
    // FR: Lit une variable de front matter, ou une valeur par défaut si absente.
    template<typename T>
    T getVariable(const std::string& name, const T& default_value) const {
        auto it = variables.find(name);
        if (it == variables.end() || it->is_null()) {
            return default_value;
        }
        try {
            return it->template get<T>();
        } catch (const nlohmann::json::exception&) {
            return default_value;
        }
    }

    bool hasVariable(const std::string& name) const { return variables.contains(name); }
};

// EN: Build a page id from a path relative to the pages directory ("Blog/My Post.md" -> "blog/my-post").
// FR: Construit un id de page depuis un chemin relatif ("Blog/My Post.md" -> "blog/my-post").
std::string slugifyPath(const std::filesystem::path& relative_path);

// EN: Site-relative URL of a page: "/" for the homepage, "/<id>/" otherwise.
// FR: URL relative au site : "/" pour la page d'accueil, "/<id>/" sinon.
std::string pageUrl(const Page& page);

// EN: Insertion-ordered collection of pages keyed by id.
// FR: Collection de pages ordonnée par insertion et indexée par id.
class PageCollection {
public:
    using Predicate = std::function<bool(const Page&)>;
    using const_iterator = std::vector<Page>::const_iterator;
    using iterator = std::vector<Page>::iterator;

    // EN: Add a page; throws CollectionError if the id already exists.
    // FR: Ajoute une page ; lance CollectionError si l'id existe déjà.
    void add(Page page);

    // EN: Replace the page with the same id, or add it if absent.
    // FR: Remplace la page de même id, ou l'ajoute si absente.
    void replace(Page page);

    bool remove(const std::string& id);
    bool has(const std::string& id) const;

    // EN: Throws CollectionError if the id is unknown.
    // FR: Lance CollectionError si l'id est inconnu.
    const Page& get(const std::string& id) const;
    Page& get(const std::string& id);

    const Page* find(const std::string& id) const;

    std::vector<const Page*> filter(const Predicate& predicate) const;

    void clear();
    std::size_t size() const { return pages_.size(); }
    bool empty() const { return pages_.empty(); }

    iterator begin() { return pages_.begin(); }
    iterator end() { return pages_.end(); }
    const_iterator begin() const { return pages_.begin(); }
    const_iterator end() const { return pages_.end(); }

private:
    void reindex();

    std::vector<Page> pages_;
    std::unordered_map<std::string, std::size_t> index_;
};

std::string pageTypeToString(PageType type);

} // namespace Content
} // namespace PSB
