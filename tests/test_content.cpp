#include <gtest/gtest.h>

#include <map>
#include <memory>

#include "content/generator.hpp"
#include "content/menu.hpp"
#include "content/page.hpp"
#include "content/renderer.hpp"
#include "content/taxonomy.hpp"
#include "infrastructure/system/build_errors.hpp"
#include "orchestrator/build_context.hpp"

using namespace PSB;
using namespace PSB::Content;

namespace {

Page makePage(const std::string& id, const std::string& title = "") {
    Page page;
    page.id = id;
    page.title = title.empty() ? id : title;
    return page;
}

} // namespace

TEST(PageCollectionTest, RejectsDuplicateIds) {
    PageCollection pages;
    pages.add(makePage("about"));

    EXPECT_THROW(pages.add(makePage("about")), CollectionError);
    EXPECT_EQ(pages.size(), 1u);
}

TEST(PageCollectionTest, KeepsInsertionOrderAcrossRemoval) {
    PageCollection pages;
    pages.add(makePage("a"));
    pages.add(makePage("b"));
    pages.add(makePage("c"));

    EXPECT_TRUE(pages.remove("b"));
    EXPECT_FALSE(pages.remove("b"));

    std::vector<std::string> ids;
    for (const auto& page : pages) {
        ids.push_back(page.id);
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(pages.get("c").id, "c");
}

TEST(PageCollectionTest, ReplaceGetAndFilter) {
    PageCollection pages;
    pages.add(makePage("a", "Old"));
    pages.replace(makePage("a", "New"));
    pages.replace(makePage("b"));

    EXPECT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages.get("a").title, "New");
    EXPECT_THROW(pages.get("missing"), CollectionError);
    EXPECT_EQ(pages.find("missing"), nullptr);

    auto filtered = pages.filter([](const Page& page) { return page.title == "New"; });
    ASSERT_EQ(filtered.size(), 1u);
    EXPECT_EQ(filtered[0]->id, "a");
}

TEST(PageTest, SlugifyPath) {
    EXPECT_EQ(slugifyPath("Blog/My First Post.md"), "blog/my-first-post");
    EXPECT_EQ(slugifyPath("index.md"), "index");
    EXPECT_EQ(slugifyPath("docs/v1.2/api.html"), "docs/v1.2/api");
}

TEST(PageTest, VariablesWithDefaults) {
    Page page;
    page.variables = {{"weight", 3}, {"title", "Hello"}};

    EXPECT_EQ(page.getVariable<int>("weight", 0), 3);
    EXPECT_EQ(page.getVariable<int>("title", 7), 7);
    EXPECT_EQ(page.getVariable<std::string>("missing", "x"), "x");
    EXPECT_TRUE(page.hasVariable("title"));
}

TEST(MenuTest, SortsByWeightThenName) {
    Menu menu("main");
    menu.add({"b", "Blog", "/blog/", "blog", 20, {}});
    menu.add({"a", "About", "/about/", "about", 10, {}});
    menu.add({"c", "Contact", "/contact/", "contact", 10, {}});
    menu.sort();

    ASSERT_EQ(menu.size(), 3u);
    EXPECT_EQ(menu.entries()[0].id, "a");
    EXPECT_EQ(menu.entries()[1].id, "c");
    EXPECT_EQ(menu.entries()[2].id, "b");
}

TEST(MenuTest, AddReplacesSameId) {
    Menu menu("main");
    menu.add({"a", "About", "/about/", "about", 10, {}});
    menu.add({"a", "About us", "/about/", "about", 5, {}});

    ASSERT_EQ(menu.size(), 1u);
    EXPECT_EQ(menu.find("a")->name, "About us");
}

TEST(MenuCollectionTest, UnknownMenuThrows) {
    MenuCollection menus;
    menus.getOrCreate("main");
    EXPECT_TRUE(menus.has("main"));
    EXPECT_THROW(menus.get("footer"), CollectionError);
}

// EN: Taxonomies hold page ids; resolving skips pages that no longer exist.
// FR: Les taxonomies portent des ids de page ; la résolution ignore les pages disparues.
TEST(TaxonomyTest, ResolveSkipsRemovedPages) {
    PageCollection pages;
    pages.add(makePage("one"));
    pages.add(makePage("two"));

    TaxonomyCollection taxonomies;
    auto& tags = taxonomies.getOrCreate("tags");
    tags.tag("C++ Tips", "one");
    tags.tag("C++ Tips", "two");
    tags.tag("C++ Tips", "two");

    ASSERT_TRUE(tags.has("c-tips"));
    EXPECT_EQ(tags.find("c-tips")->page_ids.size(), 2u);

    pages.remove("two");
    auto live = taxonomies.resolve("tags", "c-tips", pages);
    ASSERT_EQ(live.size(), 1u);
    EXPECT_EQ(live[0]->id, "one");

    EXPECT_TRUE(taxonomies.resolve("tags", "unknown", pages).empty());
    EXPECT_THROW(taxonomies.get("categories"), CollectionError);
}

TEST(BuildContextTest, RemovePageDropsReferences) {
    Orchestrator::BuildContext context(nullptr, nullptr);
    context.getPages().add(makePage("about"));
    context.getPages().add(makePage("blog"));

    std::map<std::string, MenuCollection> menus;
    menus["en"].getOrCreate("main").add({"about", "About", "/about/", "about", 0, {}});
    menus["en"].getOrCreate("main").add({"blog", "Blog", "/blog/", "blog", 0, {}});
    context.setMenus(std::move(menus));

    context.getTaxonomies().getOrCreate("tags").tag("news", "about");

    EXPECT_TRUE(context.removePage("about"));
    EXPECT_FALSE(context.removePage("about"));

    EXPECT_FALSE(context.getPages().has("about"));
    EXPECT_EQ(context.getMenus("en").get("main").size(), 1u);
    EXPECT_FALSE(context.getTaxonomies().get("tags").has("news"));
    EXPECT_THROW(context.getMenus("fr"), CollectionError);
}

TEST(BuildContextTest, RejectsNullHandles) {
    Orchestrator::BuildContext context(nullptr, nullptr);
    EXPECT_THROW(context.setConfig(nullptr), BuildError);
    EXPECT_THROW(context.setLogger(nullptr), BuildError);
    EXPECT_THROW(context.getRenderer(), BuildError);
    EXPECT_FALSE(context.hasRenderer());
}

TEST(RendererTest, SubstitutesPageAndSiteVariables) {
    Page page = makePage("about", "About");
    page.variables = {{"author", {{"name", "Ada"}}}};
    page.content = "<h1>{{ page.title }}</h1><p>{{page.author.name}} @ {{ site.title }}</p>{{ page.nope }}";

    PlaceholderRenderer renderer;
    const std::string html = renderer.render(page, {{"title", "Papyrus"}});

    EXPECT_EQ(html, "<h1>About</h1><p>Ada @ Papyrus</p>{{ page.nope }}");
}

TEST(GeneratorTest, AliasRedirectsAreVirtual) {
    PageCollection pages;
    Page page = makePage("blog/new-post", "New post");
    page.variables = {{"aliases", nlohmann::json::array({"old-post", "blog/new-post"})}};
    pages.add(page);

    SiteConfig config;
    config.set("baseurl", std::string("https://example.com"));

    GeneratorManager manager;
    manager.addGenerator(10, std::make_unique<AliasRedirectGenerator>());

    Logger logger;
    logger.setConsoleOutput(false);
    EXPECT_EQ(manager.process(pages, TaxonomyCollection{}, config, logger), 1u);

    ASSERT_TRUE(pages.has("old-post"));
    const Page& redirect = pages.get("old-post");
    EXPECT_TRUE(redirect.is_virtual);
    EXPECT_EQ(redirect.type, PageType::REDIRECT);
    EXPECT_EQ(redirect.getVariable<std::string>("redirect", ""), "https://example.com/blog/new-post/");
}

TEST(GeneratorTest, HomepageAliasRedirectsToSiteRoot) {
    PageCollection pages;
    Page home = makePage("index", "Home");
    home.type = PageType::HOMEPAGE;
    home.variables = {{"aliases", nlohmann::json::array({"home"})}};
    pages.add(home);

    SiteConfig config;
    config.set("baseurl", std::string("https://example.com/"));

    AliasRedirectGenerator generator;
    const PageCollection redirects = generator.generate(pages, TaxonomyCollection{}, config);

    ASSERT_TRUE(redirects.has("home"));
    EXPECT_EQ(redirects.get("home").getVariable<std::string>("redirect", ""), "https://example.com/");
    EXPECT_EQ(pageUrl(home), "/");
}

TEST(GeneratorTest, GeneratorsSeeTaxonomies) {
    class TermPages : public GeneratorInterface {
    public:
        std::string getName() const override { return "term-pages"; }
        PageCollection generate(const PageCollection&, const TaxonomyCollection& taxonomies,
                                const SiteConfig&) override {
            PageCollection generated;
            for (const auto& [plural, vocabulary] : taxonomies.vocabularies()) {
                for (const auto& [term_id, term] : vocabulary.terms()) {
                    Page page = makePage(plural + "/" + term_id, term.name);
                    page.type = PageType::TERM;
                    generated.add(std::move(page));
                }
            }
            return generated;
        }
    };

    PageCollection pages;
    pages.add(makePage("blog/post-1"));
    TaxonomyCollection taxonomies;
    taxonomies.getOrCreate("tags").tag("News", "blog/post-1");

    GeneratorManager manager;
    manager.addGenerator(10, std::make_unique<TermPages>());

    Logger logger;
    logger.setConsoleOutput(false);
    EXPECT_EQ(manager.process(pages, taxonomies, SiteConfig{}, logger), 1u);

    ASSERT_TRUE(pages.has("tags/news"));
    EXPECT_TRUE(pages.get("tags/news").is_virtual);
    EXPECT_EQ(pages.get("tags/news").type, PageType::TERM);
}

TEST(GeneratorTest, RunsByPriority) {
    class Named : public GeneratorInterface {
    public:
        explicit Named(std::string name) : name_(std::move(name)) {}
        std::string getName() const override { return name_; }
        PageCollection generate(const PageCollection&, const TaxonomyCollection&, const SiteConfig&) override {
            return {};
        }

    private:
        std::string name_;
    };

    GeneratorManager manager;
    manager.addGenerator(20, std::make_unique<Named>("late"));
    manager.addGenerator(10, std::make_unique<Named>("early"));
    manager.addGenerator(20, std::make_unique<Named>("late-2"));
    manager.addGenerator(5, nullptr);

    EXPECT_EQ(manager.getNames(), (std::vector<std::string>{"early", "late", "late-2"}));
}
