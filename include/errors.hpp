/**
 * CardForge Engine - Error Types
 *
 * Every failure the engine throws is a GameError carrying the kind of
 * failure, so callers can catch one type and branch on kind() when they
 * need to tell bad input apart from an illegal move.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cardforge {

enum class ErrorKind : uint8_t {
    VALIDATION,     // Malformed entity or document
    ACTION,         // Action precondition not met
    EVENT_SYSTEM    // Event queue overflow
};

std::string to_string(ErrorKind kind);

class GameError : public std::runtime_error {
public:
    GameError(const std::string& message, ErrorKind kind)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * ValidationError - An entity or document failed construction checks.
 */
class ValidationError : public GameError {
public:
    explicit ValidationError(const std::string& message)
        : GameError(message, ErrorKind::VALIDATION) {}
};

/**
 * ActionError - A state transition was rejected.
 *
 * Thrown before anything is built, so the input game is never touched.
 */
class ActionError : public GameError {
public:
    explicit ActionError(const std::string& message)
        : GameError(message, ErrorKind::ACTION) {}
};

class EventSystemError : public GameError {
public:
    explicit EventSystemError(const std::string& message)
        : GameError(message, ErrorKind::EVENT_SYSTEM) {}
};

} // namespace cardforge
