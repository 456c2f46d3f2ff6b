#pragma once

#include <stdexcept>
#include <string>

// Malformed candidate. The candidate is dropped, the batch continues.
class InvalidInputError : public std::runtime_error {
public:
    explicit InvalidInputError(const std::string& what) : std::runtime_error(what) {}
};

// Missing or unusable estimator feature. Never escapes an estimator.
class DataQualityError : public std::runtime_error {
public:
    explicit DataQualityError(const std::string& what) : std::runtime_error(what) {}
};

class ModelLoadError : public std::runtime_error {
public:
    explicit ModelLoadError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};
