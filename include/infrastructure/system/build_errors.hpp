// EN: Exception hierarchy raised across the build pipeline boundary.
// FR: Hiérarchie d'exceptions levées à la frontière du pipeline de build.

#pragma once

#include <stdexcept>
#include <string>

namespace PSB {

// EN: Base class for every build-level failure.
// FR: Classe de base pour tout échec au niveau du build.
class BuildError : public std::runtime_error {
public:
    explicit BuildError(const std::string& message) : std::runtime_error(message) {}
};

// EN: Failure of a single step, carrying the step name and the underlying cause.
// FR: Échec d'une étape, portant le nom de l'étape et la cause sous-jacente.
class StepFailure : public BuildError {
public:
    // EN: Phase in which the step failed.
    // FR: Phase dans laquelle l'étape a échoué.
    enum class Phase {
        INIT,
        PROCESS
    };

    StepFailure(const std::string& step_name, Phase phase, const std::string& cause)
        : BuildError("Step '" + step_name + "' failed during " +
                     (phase == Phase::INIT ? std::string("init") : std::string("process")) +
                     ": " + cause),
          step_name_(step_name), phase_(phase), cause_(cause) {}

    const std::string& stepName() const { return step_name_; }
    Phase phase() const { return phase_; }
    const std::string& cause() const { return cause_; }

private:
    std::string step_name_;
    Phase phase_;
    std::string cause_;
};

// EN: Misuse of a build collection (duplicate id, missing entry, unknown language).
// FR: Mauvaise utilisation d'une collection (id dupliqué, entrée absente, langue inconnue).
class CollectionError : public BuildError {
public:
    explicit CollectionError(const std::string& message) : BuildError(message) {}
};

} // namespace PSB
