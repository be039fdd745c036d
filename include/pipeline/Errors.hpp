#pragma once
#include <stdexcept>
#include <string>

namespace kwe {

// Raised for option values the pipeline cannot run with (limit < 1, ...).
// Thrown before any text is processed.
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::invalid_argument("invalid configuration: " + what) {}
};

}  // namespace kwe
