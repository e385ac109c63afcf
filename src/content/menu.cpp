#include "content/menu.hpp"
#include "infrastructure/system/build_errors.hpp"

#include <algorithm>
#include <iterator>

namespace PSB {
namespace Content {

namespace {

void sortEntries(std::vector<MenuEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(), [](const MenuEntry& a, const MenuEntry& b) {
        if (a.weight != b.weight) {
            return a.weight < b.weight;
        }
        return a.name < b.name;
    });
    for (auto& entry : entries) {
        sortEntries(entry.children);
    }
}

std::size_t removeEntries(std::vector<MenuEntry>& entries, const std::string& page_id) {
    std::size_t removed = 0;
    for (auto& entry : entries) {
        removed += removeEntries(entry.children, page_id);
    }
    auto it = std::remove_if(entries.begin(), entries.end(),
                             [&page_id](const MenuEntry& e) { return e.page_id == page_id; });
    removed += static_cast<std::size_t>(std::distance(it, entries.end()));
    entries.erase(it, entries.end());
    return removed;
}

} // namespace

void Menu::add(MenuEntry entry) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&entry](const MenuEntry& e) { return e.id == entry.id; });
    if (it != entries_.end()) {
        *it = std::move(entry);
    } else {
        entries_.push_back(std::move(entry));
    }
}

bool Menu::has(const std::string& id) const {
    return find(id) != nullptr;
}

const MenuEntry* Menu::find(const std::string& id) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&id](const MenuEntry& e) { return e.id == id; });
    return it == entries_.end() ? nullptr : &*it;
}

void Menu::sort() {
    sortEntries(entries_);
}

std::size_t Menu::removeReferencesTo(const std::string& page_id) {
    return removeEntries(entries_, page_id);
}

Menu& MenuCollection::getOrCreate(const std::string& name) {
    auto it = std::find_if(menus_.begin(), menus_.end(),
                           [&name](const Menu& m) { return m.getName() == name; });
    if (it != menus_.end()) {
        return *it;
    }
    menus_.emplace_back(name);
    return menus_.back();
}

bool MenuCollection::has(const std::string& name) const {
    return std::any_of(menus_.begin(), menus_.end(),
                       [&name](const Menu& m) { return m.getName() == name; });
}

const Menu& MenuCollection::get(const std::string& name) const {
    auto it = std::find_if(menus_.begin(), menus_.end(),
                           [&name](const Menu& m) { return m.getName() == name; });
    if (it == menus_.end()) {
        throw CollectionError("Menu '" + name + "' does not exist");
    }
    return *it;
}

std::size_t MenuCollection::removeReferencesTo(const std::string& page_id) {
    std::size_t removed = 0;
    for (auto& menu : menus_) {
        removed += menu.removeReferencesTo(page_id);
    }
    return removed;
}

} // namespace Content
} // namespace PSB
