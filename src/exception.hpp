#pragma once

#include <stdexcept>
#include <string>

class DepviewException : public std::runtime_error {
public:
    explicit DepviewException(const std::string& message)
        : std::runtime_error(message) {}
};
