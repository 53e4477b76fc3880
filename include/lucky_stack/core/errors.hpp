#pragma once

#include <stdexcept>
#include <string>

namespace lucky_stack {

class LuckyStackError : public std::runtime_error {
public:
    explicit LuckyStackError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public LuckyStackError {
public:
    explicit ConfigError(const std::string& message)
        : LuckyStackError("Config error: " + message) {}
};

class DimensionError : public LuckyStackError {
public:
    explicit DimensionError(const std::string& message)
        : LuckyStackError("Dimension error: " + message) {}
};

class DegenerateInputError : public LuckyStackError {
public:
    explicit DegenerateInputError(const std::string& message)
        : LuckyStackError("Degenerate input: " + message) {}
};

class NumericError : public LuckyStackError {
public:
    explicit NumericError(const std::string& message)
        : LuckyStackError("Numeric error: " + message) {}
};

class RegistrationError : public LuckyStackError {
public:
    explicit RegistrationError(const std::string& message)
        : LuckyStackError("Registration error: " + message) {}
};

class IOError : public LuckyStackError {
public:
    explicit IOError(const std::string& message)
        : LuckyStackError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

} // namespace lucky_stack
