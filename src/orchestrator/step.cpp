#include "orchestrator/step.hpp"
#include "orchestrator/builder.hpp"

namespace PSB {
namespace Orchestrator {

AbstractStep::AbstractStep(Builder& builder)
    : builder_(builder),
      config_(builder.getConfig()),
      logger_(builder.getLogger()) {}

void AbstractStep::init(const BuildOptions& options) {
    options_ = options;
    can_process_ = true;
}

} // namespace Orchestrator
} // namespace PSB
