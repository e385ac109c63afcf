// EN: Menu entries and per-language menu collections.
// FR: Entrées de menu et collections de menus par langue.

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace PSB {
namespace Content {

// EN: One entry of a menu tree. page_id is empty for external links.
// FR: Une entrée d'un arbre de menu. page_id est vide pour les liens externes.
struct MenuEntry {
    std::string id;
    std::string name;
    std::string url;
    std::string page_id;
    int weight = 0;
    std::vector<MenuEntry> children;
};

// EN: A named menu ("main", "footer") holding an ordered tree of entries.
// FR: Un menu nommé ("main", "footer") contenant un arbre ordonné d'entrées.
class Menu {
public:
    explicit Menu(std::string name) : name_(std::move(name)) {}

    const std::string& getName() const { return name_; }

    // EN: Add or replace a root entry with the same id.
    // FR: Ajoute ou remplace une entrée racine de même id.
    void add(MenuEntry entry);

    bool has(const std::string& id) const;
    const MenuEntry* find(const std::string& id) const;

    // EN: Sort entries (and children, recursively) by weight, then name.
    // FR: Trie les entrées (et enfants, récursivement) par poids, puis nom.
    void sort();

    // EN: Drop every entry, at any depth, that points at the given page.
    // FR: Retire toute entrée, à toute profondeur, pointant vers la page donnée.
    std::size_t removeReferencesTo(const std::string& page_id);

    const std::vector<MenuEntry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }

private:
    std::string name_;
    std::vector<MenuEntry> entries_;
};

// EN: All menus of one language, in creation order.
// FR: Tous les menus d'une langue, dans l'ordre de création.
class MenuCollection {
public:
    // EN: Return the named menu, creating it when absent.
    // FR: Retourne le menu nommé, en le créant s'il est absent.
    Menu& getOrCreate(const std::string& name);

    bool has(const std::string& name) const;

    // EN: Throws CollectionError when the menu is unknown.
    // FR: Lance CollectionError si le menu est inconnu.
    const Menu& get(const std::string& name) const;

    std::size_t removeReferencesTo(const std::string& page_id);

    const std::vector<Menu>& menus() const { return menus_; }
    std::size_t size() const { return menus_.size(); }
    bool empty() const { return menus_.empty(); }

private:
    std::vector<Menu> menus_;
};

} // namespace Content
} // namespace PSB
