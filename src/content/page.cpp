// EN: Page collection implementation.
// FR: Implémentation de la collection de pages.

#include "content/page.hpp"
#include "infrastructure/system/build_errors.hpp"

#include <algorithm>
#include <cctype>

namespace PSB {
namespace Content {

std::string slugifyPath(const std::filesystem::path& relative_path) {
    std::filesystem::path without_ext = relative_path;
    without_ext.replace_extension();

    std::string slug;
    bool pending_dash = false;
    for (char c : without_ext.generic_string()) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '/') {
            pending_dash = false;
            if (!slug.empty() && slug.back() != '/') {
                slug += '/';
            }
        } else if (std::isalnum(uc) || c == '_' || c == '.') {
            if (pending_dash && !slug.empty() && slug.back() != '/') {
                slug += '-';
            }
            pending_dash = false;
            slug += static_cast<char>(std::tolower(uc));
        } else {
            pending_dash = true;
        }
    }
    while (!slug.empty() && slug.back() == '/') {
        slug.pop_back();
    }
    return slug;
}

void PageCollection::add(Page page) {
    if (index_.count(page.id) > 0) {
        throw CollectionError("Page '" + page.id + "' already exists in the collection");
    }
    index_.emplace(page.id, pages_.size());
    pages_.push_back(std::move(page));
}

void PageCollection::replace(Page page) {
    auto it = index_.find(page.id);
    if (it == index_.end()) {
        add(std::move(page));
        return;
    }
    pages_[it->second] = std::move(page);
}

bool PageCollection::remove(const std::string& id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    pages_.erase(pages_.begin() + static_cast<std::ptrdiff_t>(it->second));
    reindex();
    return true;
}

bool PageCollection::has(const std::string& id) const {
    return index_.count(id) > 0;
}

const Page& PageCollection::get(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw CollectionError("Page '" + id + "' does not exist");
    }
    return pages_[it->second];
}

Page& PageCollection::get(const std::string& id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw CollectionError("Page '" + id + "' does not exist");
    }
    return pages_[it->second];
}

const Page* PageCollection::find(const std::string& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &pages_[it->second];
}

std::vector<const Page*> PageCollection::filter(const Predicate& predicate) const {
    std::vector<const Page*> result;
    for (const auto& page : pages_) {
        if (predicate(page)) {
            result.push_back(&page);
        }
    }
    return result;
}

void PageCollection::clear() {
    pages_.clear();
    index_.clear();
}

void PageCollection::reindex() {
    index_.clear();
    for (std::size_t i = 0; i < pages_.size(); ++i) {
        index_.emplace(pages_[i].id, i);
    }
}

std::string pageUrl(const Page& page) {
    if (page.type == PageType::HOMEPAGE) {
        return "/";
    }
    return "/" + page.id + "/";
}

std::string pageTypeToString(PageType type) {
    switch (type) {
        case PageType::PAGE: return "page";
        case PageType::HOMEPAGE: return "homepage";
        case PageType::SECTION: return "section";
        case PageType::VOCABULARY: return "vocabulary";
        case PageType::TERM: return "term";
        case PageType::REDIRECT: return "redirect";
        default: return "unknown";
    }
}

} // namespace Content
} // namespace PSB
