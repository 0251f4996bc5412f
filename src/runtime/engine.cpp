#include "runtime/engine.hpp"
#include "runtime/namespace_engine.hpp"
#include "runtime/docker_engine.hpp"

namespace execbox::runtime {

std::unique_ptr<IsolationEngine> make_engine(const SandboxPolicy& policy) {
    switch (policy.engine) {
        case EngineKind::DOCKER:
            return std::make_unique<DockerEngine>();
        case EngineKind::NAMESPACE:
        default:
            return std::make_unique<NamespaceEngine>();
    }
}

} // namespace execbox::runtime
