#pragma once
#include "../physics_backend.hpp"
#include <memory>

namespace charctl {

// Builds the backend named by kind. The only place that knows the concrete
// backend types.
std::shared_ptr<PhysicsBackend> make_backend(BackendKind kind);

} // namespace charctl
