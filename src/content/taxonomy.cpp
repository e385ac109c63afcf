#include "content/taxonomy.hpp"
#include "infrastructure/system/build_errors.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace PSB {
namespace Content {

std::string slugifyTerm(const std::string& name) {
    std::string slug;
    bool pending_dash = false;
    for (char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            if (pending_dash && !slug.empty()) {
                slug += '-';
            }
            pending_dash = false;
            slug += static_cast<char>(std::tolower(uc));
        } else {
            pending_dash = true;
        }
    }
    return slug;
}

void Vocabulary::tag(const std::string& term_name, const std::string& page_id) {
    const std::string term_id = slugifyTerm(term_name);
    if (term_id.empty()) {
        return;
    }
    auto [it, inserted] = terms_.try_emplace(term_id, Term{term_id, term_name, {}});
    auto& ids = it->second.page_ids;
    if (std::find(ids.begin(), ids.end(), page_id) == ids.end()) {
        ids.push_back(page_id);
    }
}

bool Vocabulary::has(const std::string& term_id) const {
    return terms_.count(term_id) > 0;
}

const Term* Vocabulary::find(const std::string& term_id) const {
    auto it = terms_.find(term_id);
    return it == terms_.end() ? nullptr : &it->second;
}

std::size_t Vocabulary::removeReferencesTo(const std::string& page_id) {
    std::size_t removed = 0;
    for (auto it = terms_.begin(); it != terms_.end();) {
        auto& ids = it->second.page_ids;
        auto end = std::remove(ids.begin(), ids.end(), page_id);
        removed += static_cast<std::size_t>(std::distance(end, ids.end()));
        ids.erase(end, ids.end());
        // EN: A term without pages is no longer reachable.
        // FR: Un terme sans pages n'est plus atteignable.
        it = ids.empty() ? terms_.erase(it) : std::next(it);
    }
    return removed;
}

Vocabulary& TaxonomyCollection::getOrCreate(const std::string& plural) {
    return vocabularies_.try_emplace(plural, plural).first->second;
}

bool TaxonomyCollection::has(const std::string& plural) const {
    return vocabularies_.count(plural) > 0;
}

const Vocabulary& TaxonomyCollection::get(const std::string& plural) const {
    auto it = vocabularies_.find(plural);
    if (it == vocabularies_.end()) {
        throw CollectionError("Vocabulary '" + plural + "' does not exist");
    }
    return it->second;
}

std::vector<const Page*> TaxonomyCollection::resolve(const std::string& plural,
                                                     const std::string& term_id,
                                                     const PageCollection& pages) const {
    std::vector<const Page*> result;
    auto vocabulary = vocabularies_.find(plural);
    if (vocabulary == vocabularies_.end()) {
        return result;
    }
    const Term* term = vocabulary->second.find(term_id);
    if (!term) {
        return result;
    }
    for (const auto& id : term->page_ids) {
        if (const Page* page = pages.find(id)) {
            result.push_back(page);
        }
    }
    return result;
}

std::size_t TaxonomyCollection::removeReferencesTo(const std::string& page_id) {
    std::size_t removed = 0;
    for (auto& [_, vocabulary] : vocabularies_) {
        removed += vocabulary.removeReferencesTo(page_id);
    }
    return removed;
}

} // namespace Content
} // namespace PSB
