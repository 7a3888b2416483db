#pragma once
#include <stdexcept>
#include <string>

namespace spacearena {

// Every rule violation surfaces as one of these. name() is the stable
// identifier reported over the wire.
class ArenaError : public std::runtime_error {
public:
    explicit ArenaError(const std::string &msg) : std::runtime_error(msg) {}
    virtual const char *name() const = 0;
};

class ValidationError : public ArenaError {
public:
    using ArenaError::ArenaError;
    const char *name() const override { return "ValidationError"; }
};

class NotFoundError : public ArenaError {
public:
    using ArenaError::ArenaError;
    const char *name() const override { return "NotFoundError"; }
};

class CapacityError : public ArenaError {
public:
    using ArenaError::ArenaError;
    const char *name() const override { return "CapacityError"; }
};

class DuplicateIdError : public ArenaError {
public:
    using ArenaError::ArenaError;
    const char *name() const override { return "DuplicateIdError"; }
};

class IllegalMoveError : public ArenaError {
public:
    using ArenaError::ArenaError;
    const char *name() const override { return "IllegalMoveError"; }
};

class InactivePlayerError : public ArenaError {
public:
    using ArenaError::ArenaError;
    const char *name() const override { return "InactivePlayerError"; }
};

class ShieldAlreadyUsedError : public ArenaError {
public:
    using ArenaError::ArenaError;
    const char *name() const override { return "ShieldAlreadyUsedError"; }
};

class GameOverError : public ArenaError {
public:
    using ArenaError::ArenaError;
    const char *name() const override { return "GameOverError"; }
};

// Raised by the server boundary only; the engine never throws it.
class RateLimitError : public ArenaError {
public:
    using ArenaError::ArenaError;
    const char *name() const override { return "RateLimitError"; }
};

} 
