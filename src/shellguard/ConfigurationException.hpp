#pragma once

#include <stdexcept>
#include <string>

class ConfigurationException : public std::runtime_error {
public:
    explicit ConfigurationException(const std::string& message)
        : std::runtime_error("configuration error: " + message) {}
};
