#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "infrastructure/system/build_errors.hpp"
#include "orchestrator/builder.hpp"

using namespace PSB;
using namespace PSB::Orchestrator;

namespace {

using Journal = std::vector<std::string>;

// EN: Scripted step recording every call in a shared journal.
// FR: Étape scriptée enregistrant chaque appel dans un journal partagé.
class ScriptedStep : public StepInterface {
public:
    struct Script {
        std::string name;
        bool can_process = true;
        bool fail_init = false;
        bool fail_process = false;
    };

    ScriptedStep(Script script, std::shared_ptr<Journal> journal)
        : script_(std::move(script)), journal_(std::move(journal)) {}

    void init(const BuildOptions& options) override {
        journal_->push_back("init:" + script_.name);
        options_ = options;
        if (script_.fail_init) {
            throw std::runtime_error("init exploded");
        }
    }

    bool canProcess() const override {
        journal_->push_back("canProcess:" + script_.name);
        return script_.can_process;
    }

    std::string getName() const override { return script_.name; }

    void process() override {
        journal_->push_back("process:" + script_.name);
        if (script_.fail_process) {
            throw std::runtime_error("disk full");
        }
    }

    const BuildOptions& options() const { return options_; }

private:
    Script script_;
    std::shared_ptr<Journal> journal_;
    BuildOptions options_;
};

class MockStep : public StepInterface {
public:
    MOCK_METHOD(void, init, (const BuildOptions& options), (override));
    MOCK_METHOD(bool, canProcess, (), (const, override));
    MOCK_METHOD(std::string, getName, (), (const, override));
    MOCK_METHOD(void, process, (), (override));
};

// EN: Step running an arbitrary action against the builder.
// FR: Étape exécutant une action arbitraire sur le builder.
class ActionStep : public AbstractStep {
public:
    ActionStep(Builder& builder, std::string name, std::function<void(Builder&)> action)
        : AbstractStep(builder), name_(std::move(name)), action_(std::move(action)) {}

    std::string getName() const override { return name_; }
    void process() override { action_(builder_); }

private:
    std::string name_;
    std::function<void(Builder&)> action_;
};

} // namespace

// EN: Test fixture: a builder over a custom catalogue with a capturing logger.
// FR: Fixture de test : un builder sur un catalogue personnalisé avec un logger de capture.
class BuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        journal = std::make_shared<Journal>();

        config = std::make_shared<SiteConfig>();
        config->set("baseurl", std::string("https://example.com/"));

        logger = std::make_shared<Logger>();
        logger->setConsoleOutput(false);
        logger->setLogLevel(LogLevel::DEBUG);
        logger->addListener([this](const Logger::LogEntry& entry) { entries.push_back(entry); });
    }

    StepSpec scripted(ScriptedStep::Script script) {
        auto journal_handle = journal;
        return StepSpec{script.name, [script, journal_handle](Builder&) -> std::unique_ptr<StepInterface> {
            return std::make_unique<ScriptedStep>(script, journal_handle);
        }};
    }

    std::unique_ptr<Builder> makeBuilder(std::vector<StepSpec> catalogue) {
        return std::make_unique<Builder>(config, logger, std::move(catalogue));
    }

    std::vector<Logger::LogEntry> entriesAt(LogLevel level) const {
        std::vector<Logger::LogEntry> result;
        for (const auto& entry : entries) {
            if (entry.level == level) {
                result.push_back(entry);
            }
        }
        return result;
    }

    std::vector<std::string> processed() const {
        std::vector<std::string> result;
        for (const auto& call : *journal) {
            if (call.rfind("process:", 0) == 0) {
                result.push_back(call.substr(8));
            }
        }
        return result;
    }

    std::size_t summaryCount() const {
        std::size_t count = 0;
        for (const auto& entry : entriesAt(LogLevel::NOTICE)) {
            if (entry.message.rfind("Built in ", 0) == 0) {
                ++count;
            }
        }
        return count;
    }

    std::shared_ptr<Journal> journal;
    std::shared_ptr<SiteConfig> config;
    std::shared_ptr<Logger> logger;
    std::vector<Logger::LogEntry> entries;
};

// EN: [A, B(skipped), C] runs A then C, reports (A,1,2) and (C,2,2), then one summary.
// FR: [A, B(ignorée), C] exécute A puis C, annonce (A,1,2) et (C,2,2), puis un seul résumé.
TEST_F(BuilderTest, ExecutesApplicableStepsInCatalogueOrder) {
    auto builder = makeBuilder({
        scripted({"A", true}),
        scripted({"B", false}),
        scripted({"C", true}),
    });

    builder->build();

    EXPECT_EQ(processed(), (std::vector<std::string>{"A", "C"}));

    auto notices = entriesAt(LogLevel::NOTICE);
    ASSERT_EQ(notices.size(), 3u);

    EXPECT_EQ(notices[0].metadata.at("step"), "A");
    EXPECT_EQ(notices[0].metadata.at("step_index"), "1");
    EXPECT_EQ(notices[0].metadata.at("step_total"), "2");

    EXPECT_EQ(notices[1].metadata.at("step"), "C");
    EXPECT_EQ(notices[1].metadata.at("step_index"), "2");
    EXPECT_EQ(notices[1].metadata.at("step_total"), "2");

    EXPECT_EQ(notices[2].message.rfind("Built in ", 0), 0u);
    EXPECT_EQ(summaryCount(), 1u);
}

// EN: The init pass completes for every step before the first process() call.
// FR: La passe init se termine pour toutes les étapes avant le premier appel à process().
TEST_F(BuilderTest, InitPassPrecedesProcessPass) {
    auto builder = makeBuilder({scripted({"A", true}), scripted({"B", true})});

    builder->build();

    EXPECT_EQ(*journal, (Journal{"init:A", "canProcess:A", "init:B", "canProcess:B", "process:A", "process:B"}));
}

TEST_F(BuilderTest, SkippedStepIsNeverProcessed) {
    auto holder = std::make_shared<std::unique_ptr<MockStep>>(std::make_unique<::testing::NiceMock<MockStep>>());
    MockStep* mock = holder->get();

    ON_CALL(*mock, getName()).WillByDefault(::testing::Return("Optimizing"));
    EXPECT_CALL(*mock, init(::testing::_)).Times(1);
    EXPECT_CALL(*mock, canProcess()).WillOnce(::testing::Return(false));
    EXPECT_CALL(*mock, process()).Times(0);

    auto builder = makeBuilder({
        scripted({"A", true}),
        StepSpec{"optimize", [holder](Builder&) -> std::unique_ptr<StepInterface> { return std::move(*holder); }},
    });

    builder->build();
    EXPECT_EQ(processed(), (std::vector<std::string>{"A"}));
}

// EN: [A(fails), B]: B never runs, the failure names A, no summary is logged.
// FR: [A(échoue), B] : B ne s'exécute jamais, l'échec nomme A, aucun résumé n'est logué.
TEST_F(BuilderTest, FailingStepAbortsBuild) {
    auto builder = makeBuilder({
        scripted({"A", true, false, true}),
        scripted({"B", true}),
    });

    try {
        builder->build();
        FAIL() << "build() should have thrown";
    } catch (const StepFailure& failure) {
        EXPECT_EQ(failure.stepName(), "A");
        EXPECT_EQ(failure.phase(), StepFailure::Phase::PROCESS);
        EXPECT_EQ(failure.cause(), "disk full");
        EXPECT_NE(std::string(failure.what()).find("'A'"), std::string::npos);
    }

    EXPECT_EQ(processed(), (std::vector<std::string>{"A"}));
    EXPECT_EQ(summaryCount(), 0u);

    auto errors = entriesAt(LogLevel::ERROR);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].metadata.at("step"), "A");
}

TEST_F(BuilderTest, FailureInMiddleKeepsEarlierWork) {
    auto builder = makeBuilder({
        StepSpec{"set", [](Builder& b) -> std::unique_ptr<StepInterface> {
            return std::make_unique<ActionStep>(b, "Set data", [](Builder& target) {
                target.getData()["site"] = {{"name", "papyrus"}};
            });
        }},
        scripted({"Broken", true, false, true}),
        scripted({"Never", true}),
    });

    EXPECT_THROW(builder->build(), StepFailure);
    EXPECT_EQ(builder->getData().count("site"), 1u);
    EXPECT_EQ(processed(), (std::vector<std::string>{"Broken"}));
}

TEST_F(BuilderTest, InitFailureAbortsBeforeProcessing) {
    auto builder = makeBuilder({
        scripted({"A", true}),
        scripted({"B", true, true, false}),
        scripted({"C", true}),
    });

    try {
        builder->build();
        FAIL() << "build() should have thrown";
    } catch (const StepFailure& failure) {
        EXPECT_EQ(failure.stepName(), "B");
        EXPECT_EQ(failure.phase(), StepFailure::Phase::INIT);
        EXPECT_EQ(failure.cause(), "init exploded");
    }

    EXPECT_TRUE(processed().empty());
    EXPECT_EQ(summaryCount(), 0u);
}

TEST_F(BuilderTest, NonStandardExceptionIsReportedAsStepFailure) {
    auto builder = makeBuilder({
        StepSpec{"odd", [](Builder& b) -> std::unique_ptr<StepInterface> {
            return std::make_unique<ActionStep>(b, "Odd", [](Builder&) { throw 42; });
        }},
    });

    try {
        builder->build();
        FAIL() << "build() should have thrown";
    } catch (const StepFailure& failure) {
        EXPECT_EQ(failure.stepName(), "Odd");
        EXPECT_EQ(failure.cause(), "unknown error");
    }
}

TEST_F(BuilderTest, MissingFactoryIsAnInitFailure) {
    auto builder = makeBuilder({StepSpec{"ghost", nullptr}});

    try {
        builder->build();
        FAIL() << "build() should have thrown";
    } catch (const StepFailure& failure) {
        EXPECT_EQ(failure.stepName(), "ghost");
        EXPECT_EQ(failure.phase(), StepFailure::Phase::INIT);
    }
}

// EN: Empty or slash-only base URL: exactly one error, the build still completes.
// FR: URL de base vide ou composée de slashs : exactement une erreur, le build se termine quand même.
TEST_F(BuilderTest, InvalidBaseUrlLogsSingleErrorAndContinues) {
    for (const std::string baseurl : {"", "   ", " / ", "//"}) {
        entries.clear();
        journal->clear();
        config->set("baseurl", baseurl);

        auto builder = makeBuilder({scripted({"A", true})});
        builder->build();

        EXPECT_EQ(entriesAt(LogLevel::ERROR).size(), 1u) << "baseurl='" << baseurl << "'";
        EXPECT_EQ(processed(), (std::vector<std::string>{"A"}));
        EXPECT_EQ(summaryCount(), 1u);
    }
}

TEST_F(BuilderTest, ValidBaseUrlLogsNoError) {
    auto builder = makeBuilder({scripted({"A", true})});
    builder->build();
    EXPECT_TRUE(entriesAt(LogLevel::ERROR).empty());
}

TEST_F(BuilderTest, OptionsReachEveryStep) {
    std::vector<BuildOptions> seen;
    auto builder = makeBuilder({
        StepSpec{"probe", [&seen](Builder& b) -> std::unique_ptr<StepInterface> {
            return std::make_unique<ActionStep>(b, "Probe", [&seen](Builder& target) {
                seen.push_back(target.getBuildOptions());
            });
        }},
    });

    builder->build({{"drafts", true}, {"theme", std::string("dark")}});

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_TRUE(seen[0].includeDrafts());
    EXPECT_FALSE(seen[0].isDryRun());
    EXPECT_EQ(seen[0].get("theme").asOrDefault<std::string>(""), "dark");
}

TEST_F(BuilderTest, LaterStepsSeeEarlierMutations) {
    std::size_t pages_seen = 0;
    auto builder = makeBuilder({
        StepSpec{"create", [](Builder& b) -> std::unique_ptr<StepInterface> {
            return std::make_unique<ActionStep>(b, "Create", [](Builder& target) {
                Content::Page page;
                page.id = "about";
                target.getPages().add(page);
            });
        }},
        StepSpec{"count", [&pages_seen](Builder& b) -> std::unique_ptr<StepInterface> {
            return std::make_unique<ActionStep>(b, "Count", [&pages_seen](Builder& target) {
                pages_seen = target.getPages().size();
            });
        }},
    });

    builder->build();
    EXPECT_EQ(pages_seen, 1u);
}

// EN: Each build() runs a full init + process pass; the builder itself never clears collections.
// FR: Chaque build() exécute une passe complète ; le builder ne vide jamais les collections lui-même.
TEST_F(BuilderTest, BuildIsReentrant) {
    int counter = 0;
    auto builder = makeBuilder({
        scripted({"A", true}),
        StepSpec{"accumulate", [&counter](Builder& b) -> std::unique_ptr<StepInterface> {
            return std::make_unique<ActionStep>(b, "Accumulate", [&counter](Builder& target) {
                target.getData()["run-" + std::to_string(++counter)] = counter;
            });
        }},
    });

    builder->build().build();

    EXPECT_EQ(processed(), (std::vector<std::string>{"A", "A"}));
    EXPECT_EQ(builder->getBuildCount(), 2u);
    EXPECT_EQ(builder->getData().size(), 2u);
    EXPECT_EQ(summaryCount(), 2u);
}

TEST_F(BuilderTest, ConfigCanOnlyBeReplacedBeforeFirstBuild) {
    auto builder = makeBuilder({scripted({"A", true})});

    auto replacement = std::make_shared<SiteConfig>();
    replacement->set("baseurl", std::string("https://papyrus.test/"));
    builder->setConfig(replacement);
    EXPECT_EQ(builder->getConfig().getString("baseurl"), "https://papyrus.test/");

    EXPECT_THROW(builder->setConfig(nullptr), BuildError);

    builder->build();
    EXPECT_THROW(builder->setConfig(std::make_shared<SiteConfig>()), BuildError);
}

TEST_F(BuilderTest, AddStepAppendsToCatalogue) {
    auto builder = makeBuilder({scripted({"A", true})});
    builder->addStep(scripted({"Z", true}));

    ASSERT_EQ(builder->getCatalogue().size(), 2u);
    EXPECT_EQ(builder->getCatalogue().back().id, "Z");

    builder->build();
    EXPECT_EQ(processed(), (std::vector<std::string>{"A", "Z"}));
}

TEST_F(BuilderTest, SourceAndDestinationAccessors) {
    auto builder = makeBuilder({});
    builder->setSourceDir(std::filesystem::path("/srv/site"));
    builder->setDestinationDir(std::nullopt);
    EXPECT_EQ(builder->getSourceDir(), std::filesystem::path("/srv/site"));
    EXPECT_EQ(builder->getDestinationDir(), std::filesystem::path("/srv/site"));

    builder->setDestinationDir(std::filesystem::path("/srv/out"));
    EXPECT_EQ(builder->getDestinationDir(), std::filesystem::path("/srv/out"));
}

TEST_F(BuilderTest, RendererAccessors) {
    auto builder = makeBuilder({});
    EXPECT_THROW(builder->getRenderer(), BuildError);

    builder->setRenderer(std::make_shared<Content::PlaceholderRenderer>());
    EXPECT_EQ(builder->getRenderer().getName(), "placeholder");
}

TEST_F(BuilderTest, DebugFromEnvironment) {
    setenv(kDebugEnvironmentVariable, "true", 1);
    auto debug_builder = makeBuilder({});
    unsetenv(kDebugEnvironmentVariable);

    EXPECT_TRUE(debug_builder->isDebug());
    EXPECT_FALSE(makeBuilder({})->isDebug());
}

TEST_F(BuilderTest, DebugFromConfiguration) {
    config->set("debug", true);
    EXPECT_TRUE(makeBuilder({})->isDebug());
}

TEST_F(BuilderTest, DefaultCatalogueIsInDependencyOrder) {
    Builder builder(config, logger);

    std::vector<std::string> ids;
    for (const auto& spec : builder.getCatalogue()) {
        ids.push_back(spec.id);
    }
    EXPECT_EQ(ids, (std::vector<std::string>{
        "pages.load", "data.load", "static.load", "pages.create", "taxonomies.create",
        "pages.generate", "menus.create", "static.copy", "pages.render", "pages.save"}));
    EXPECT_EQ(builder.getContext().getGeneratorManager().size(), 1u);
}
