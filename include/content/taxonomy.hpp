// EN: Taxonomy vocabularies and terms. Terms reference pages by id only.
// FR: Vocabulaires et termes de taxonomie. Les termes référencent les pages par id uniquement.

#pragma once

#include "content/page.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace PSB {
namespace Content {

// EN: One term ("c++") and the ids of the pages tagged with it, in tagging order.
// FR: Un terme ("c++") et les ids des pages étiquetées, dans l'ordre d'étiquetage.
struct Term {
    std::string id;
    std::string name;
    std::vector<std::string> page_ids;
};

// EN: A vocabulary ("tags") mapping term ids to terms.
// FR: Un vocabulaire ("tags") associant les ids de termes aux termes.
class Vocabulary {
public:
    explicit Vocabulary(std::string plural) : plural_(std::move(plural)) {}

    const std::string& getName() const { return plural_; }

    // EN: Link a page to a term, creating the term on first use. Duplicate links are ignored.
    // FR: Lie une page à un terme, en créant le terme au premier usage. Les doublons sont ignorés.
    void tag(const std::string& term_name, const std::string& page_id);

    bool has(const std::string& term_id) const;
    const Term* find(const std::string& term_id) const;

    const std::map<std::string, Term>& terms() const { return terms_; }
    std::size_t size() const { return terms_.size(); }

    std::size_t removeReferencesTo(const std::string& page_id);

private:
    std::string plural_;
    std::map<std::string, Term> terms_;
};

// EN: All vocabularies of the site.
// FR: Tous les vocabulaires du site.
class TaxonomyCollection {
public:
    Vocabulary& getOrCreate(const std::string& plural);

    bool has(const std::string& plural) const;

    // EN: Throws CollectionError when the vocabulary is unknown.
    // FR: Lance CollectionError si le vocabulaire est inconnu.
    const Vocabulary& get(const std::string& plural) const;

    // EN: Pages of a term that still exist in the collection; stale ids are skipped.
    // FR: Pages d'un terme encore présentes dans la collection ; les ids obsolètes sont ignorés.
    std::vector<const Page*> resolve(const std::string& plural, const std::string& term_id,
                                     const PageCollection& pages) const;

    std::size_t removeReferencesTo(const std::string& page_id);

    void clear() { vocabularies_.clear(); }
    const std::map<std::string, Vocabulary>& vocabularies() const { return vocabularies_; }
    std::size_t size() const { return vocabularies_.size(); }
    bool empty() const { return vocabularies_.empty(); }

private:
    std::map<std::string, Vocabulary> vocabularies_;
};

// EN: Term id used in URLs ("C++ Tips" -> "c-tips").
// FR: Id de terme utilisé dans les URLs ("C++ Tips" -> "c-tips").
std::string slugifyTerm(const std::string& name);

} // namespace Content
} // namespace PSB
