#include "backend_factory.hpp"
#include "jolt_backend.hpp"
#include "reference_backend.hpp"

namespace charctl {

std::shared_ptr<PhysicsBackend> make_backend(BackendKind kind) {
    switch (kind) {
        case BackendKind::Jolt:      return std::make_shared<JoltBackend>();
        case BackendKind::Reference: return std::make_shared<ReferenceBackend>();
    }
    return std::make_shared<ReferenceBackend>();
}

} // namespace charctl
