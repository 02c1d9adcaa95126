#pragma once
#include "components.hpp"
#include "physics_backend.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace charctl {

// Throws InvalidConfiguration naming the first offending field.
void validate_config(const ControllerConfig& config);
void validate_body(const CharacterBody& body);

const char* to_string(OutputMode mode);
const char* to_string(BackendKind kind);

// Throw InvalidConfiguration on unknown names.
OutputMode parse_output_mode(const std::string& name);
BackendKind parse_backend_kind(const std::string& name);

// ---------------------------------------------------------------------------
// ConfigLoader — reads a ControllerConfig from JSON.
//
// Missing keys keep the struct defaults. The result is validated.
// ---------------------------------------------------------------------------

class ConfigLoader {
public:
    // Throws InvalidConfiguration for wrong types, unknown enum names or
    // values that fail validation.
    static ControllerConfig from_json(const nlohmann::json& j,
                                      const ControllerConfig& defaults = {});

    // Returns false (and leaves out untouched) if the text is malformed or invalid.
    static bool load_from_string(const std::string& json, ControllerConfig& out);
    static bool load(const std::string& path, ControllerConfig& out);
};

} // namespace charctl
