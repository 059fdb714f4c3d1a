#pragma once

#include <stdexcept>
#include <string>

namespace workmem {

// ─── Error Taxonomy ────────────────────────────────────────────
// Every failure raised by the working-memory core. None of them are
// retryable: they signal bad configuration, bad commands, or a broken
// internal contract.

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// Invalid store configuration (flag names, prefix, slot count).
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& what) : Error(what) {}
};

/// A command that does not decode against a FlagStore's vocabulary.
class CommandError : public Error {
public:
    explicit CommandError(const std::string& what) : Error(what) {}
};

/// A key function had no mapping for a key present in a map.
class KeyMappingError : public Error {
public:
    explicit KeyMappingError(const std::string& what) : Error(what) {}
};

/// Maps or values that cannot be combined.
class DomainError : public Error {
public:
    explicit DomainError(const std::string& what) : Error(what) {}
};

} // namespace workmem
