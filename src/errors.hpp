#pragma once
#include "components.hpp"
#include <stdexcept>
#include <string>

namespace charctl {

// ---------------------------------------------------------------------------
// Controller errors
//
// Backends throw these; CharacterControllerSystem catches them per body so a
// failure only costs that body its tick. InvalidConfiguration is raised at
// spawn and aborts only that character's creation.
// ---------------------------------------------------------------------------

enum class ErrorKind { BodyNotFound, QueryFailed, InvalidConfiguration };

class ControllerError : public std::runtime_error {
public:
    ControllerError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class BodyNotFound : public ControllerError {
public:
    explicit BodyNotFound(BodyId body)
        : ControllerError(ErrorKind::BodyNotFound,
                          "body " + std::to_string(body) + " not found"),
          body_(body) {}

    BodyId body() const { return body_; }

private:
    BodyId body_;
};

class QueryFailed : public ControllerError {
public:
    explicit QueryFailed(const std::string& what)
        : ControllerError(ErrorKind::QueryFailed, "query failed: " + what) {}
};

class InvalidConfiguration : public ControllerError {
public:
    explicit InvalidConfiguration(const std::string& what)
        : ControllerError(ErrorKind::InvalidConfiguration, "invalid configuration: " + what) {}
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BodyNotFound:         return "BodyNotFound";
        case ErrorKind::QueryFailed:          return "QueryFailed";
        case ErrorKind::InvalidConfiguration: return "InvalidConfiguration";
    }
    return "Unknown";
}

} // namespace charctl
