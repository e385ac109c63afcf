// EN: Contract every build step implements, and the catalogue entry that creates it.
// FR: Contrat implémenté par chaque étape de build, et l'entrée de catalogue qui la crée.

#pragma once

#include "orchestrator/build_options.hpp"

#include <functional>
#include <memory>
#include <string>

namespace PSB {

class Logger;
class SiteConfig;

namespace Orchestrator {

class Builder;

// EN: Lifecycle of a step for one build: init(options) -> canProcess() -> process().
//     init() and canProcess() must not mutate the build context; only process() does.
// FR: Cycle de vie d'une étape pour un build : init(options) -> canProcess() -> process().
//     init() et canProcess() ne doivent pas modifier le contexte ; seul process() le fait.
class StepInterface {
public:
    virtual ~StepInterface() = default;

    virtual void init(const BuildOptions& options) = 0;
    virtual bool canProcess() const = 0;
    virtual std::string getName() const = 0;
    virtual void process() = 0;
};

// EN: Base class for built-in steps. init() records the options and enables the step;
//     subclasses call it first, then narrow can_process_.
// FR: Classe de base des étapes intégrées. init() mémorise les options et active l'étape ;
//     les sous-classes l'appellent d'abord, puis restreignent can_process_.
class AbstractStep : public StepInterface {
public:
    explicit AbstractStep(Builder& builder);

    void init(const BuildOptions& options) override;
    bool canProcess() const override { return can_process_; }

protected:
    Builder& builder_;
    SiteConfig& config_;
    Logger& logger_;
    BuildOptions options_;
    bool can_process_ = false;
};

// EN: Creates a step bound to the builder. Called once per build.
// FR: Crée une étape liée au builder. Appelée une fois par build.
using StepFactory = std::function<std::unique_ptr<StepInterface>(Builder&)>;

// EN: One entry of the ordered step catalogue.
// FR: Une entrée du catalogue ordonné des étapes.
struct StepSpec {
    std::string id;
    StepFactory factory;
};

// EN: Catalogue entry for a step type constructible from Builder&.
// FR: Entrée de catalogue pour un type d'étape constructible depuis Builder&.
template<typename StepT>
StepSpec makeStepSpec(const std::string& id) {
    return StepSpec{id, [](Builder& builder) -> std::unique_ptr<StepInterface> {
        return std::make_unique<StepT>(builder);
    }};
}

} // namespace Orchestrator
} // namespace PSB
