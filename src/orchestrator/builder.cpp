#include "orchestrator/builder.hpp"
#include "infrastructure/system/build_errors.hpp"
#include "orchestrator/pipeline_utils.hpp"
#include "orchestrator/version_resolver.hpp"
#include "steps/builtin_steps.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <utility>

namespace PSB {
namespace Orchestrator {

namespace {

constexpr int kAliasRedirectPriority = 100;

std::string describe(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

} // namespace

Builder::Builder(std::shared_ptr<SiteConfig> config, std::shared_ptr<Logger> logger)
    : Builder(std::move(config), std::move(logger), Steps::defaultCatalogue()) {
    context_.getGeneratorManager().addGenerator(kAliasRedirectPriority,
                                                std::make_unique<Content::AliasRedirectGenerator>());
}

Builder::Builder(std::shared_ptr<SiteConfig> config,
                 std::shared_ptr<Logger> logger,
                 std::vector<StepSpec> catalogue)
    : catalogue_(std::move(catalogue)),
      context_(std::move(config), std::move(logger)) {}

Builder& Builder::build(const BuildOptionMap& overrides) {
    const auto start_time = std::chrono::steady_clock::now();
    const std::int64_t start_memory = PipelineUtils::currentMemoryUsage();

    checkBaseUrl();

    options_ = BuildOptions::resolve(overrides, &getLogger());
    ++build_count_;

    auto steps = initSteps();
    processSteps(steps);

    const auto elapsed = std::chrono::steady_clock::now() - start_time;
    const std::int64_t memory_delta = PipelineUtils::currentMemoryUsage() - start_memory;

    getLogger().notice(kBuilderLogModule,
                       "Built in " + PipelineUtils::formatSeconds(elapsed) + " s (" +
                           PipelineUtils::formatBytes(memory_delta) + ")",
                       {{"elapsed_s", PipelineUtils::formatSeconds(elapsed)},
                        {"memory_delta", std::to_string(memory_delta)}});

    return *this;
}

void Builder::checkBaseUrl() {
    const std::string baseurl = getConfig().getString("baseurl");
    if (!PipelineUtils::isProductionBaseUrl(baseurl)) {
        getLogger().error(kBuilderLogModule,
                          "'baseurl' configuration key is required in production (e.g.: \"baseurl: https://example.com/\"), got \"" +
                              baseurl + "\"");
    }
}

std::vector<std::unique_ptr<StepInterface>> Builder::initSteps() {
    std::vector<std::unique_ptr<StepInterface>> steps;
    steps.reserve(catalogue_.size());

    for (const auto& spec : catalogue_) {
        std::unique_ptr<StepInterface> step;
        std::string name = spec.id;
        bool applicable = false;

        try {
            if (!spec.factory) {
                throw BuildError("No factory registered");
            }
            step = spec.factory(*this);
            if (!step) {
                throw BuildError("Factory returned no step");
            }
            name = step->getName();
            step->init(options_);
            applicable = step->canProcess();
        } catch (...) {
            StepFailure failure(name, StepFailure::Phase::INIT, describe(std::current_exception()));
            getLogger().error(kBuilderLogModule, failure.what(),
                              {{"step", name}, {"step_id", spec.id}, {"phase", "init"}});
            throw failure;
        }

        if (applicable) {
            steps.push_back(std::move(step));
        } else {
            getLogger().debug(kBuilderLogModule, "Skipping step '" + name + "'", {{"step", name}});
        }
    }

    return steps;
}

void Builder::processSteps(const std::vector<std::unique_ptr<StepInterface>>& steps) {
    const std::string total = std::to_string(steps.size());
    std::size_t index = 0;

    for (const auto& step : steps) {
        ++index;
        const std::string name = step->getName();

        getLogger().notice(kBuilderLogModule, name,
                           {{"step", name},
                            {"step_index", std::to_string(index)},
                            {"step_total", total}});

        const auto step_start = std::chrono::steady_clock::now();
        try {
            step->process();
        } catch (...) {
            StepFailure failure(name, StepFailure::Phase::PROCESS, describe(std::current_exception()));
            getLogger().error(kBuilderLogModule, failure.what(),
                              {{"step", name},
                               {"step_index", std::to_string(index)},
                               {"step_total", total},
                               {"phase", "process"}});
            throw failure;
        }

        if (isDebug()) {
            getLogger().debug(kBuilderLogModule,
                              name + " done in " +
                                  PipelineUtils::formatSeconds(std::chrono::steady_clock::now() - step_start) + " s",
                              {{"step", name}});
        }
    }
}

Builder& Builder::addStep(StepSpec spec) {
    catalogue_.push_back(std::move(spec));
    return *this;
}

std::string Builder::getVersion() {
    return VersionResolver::getInstance().getVersion();
}

Builder& Builder::setConfig(std::shared_ptr<SiteConfig> config) {
    if (build_count_ > 0) {
        throw BuildError("Configuration cannot be replaced once a build has started");
    }
    context_.setConfig(std::move(config));
    return *this;
}

Builder& Builder::setSourceDir(const std::optional<std::filesystem::path>& source_dir) {
    context_.getConfig().setSourceDir(source_dir);
    return *this;
}

Builder& Builder::setDestinationDir(const std::optional<std::filesystem::path>& destination_dir) {
    context_.getConfig().setDestinationDir(destination_dir);
    return *this;
}

} // namespace Orchestrator
} // namespace PSB
