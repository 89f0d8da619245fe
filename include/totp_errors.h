#pragma once
#include <stdexcept>
#include <string>

// Secret is not valid base32 or decodes to nothing.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Hash algorithm identifier not in the supported set.
class UnsupportedAlgorithmError : public std::invalid_argument {
public:
    explicit UnsupportedAlgorithmError(const std::string& what) : std::invalid_argument(what) {}
};

// digits / period / counter out of range
class InvalidParameterError : public std::invalid_argument {
public:
    explicit InvalidParameterError(const std::string& what) : std::invalid_argument(what) {}
};
