#pragma once

#include <expected>
#include <string>

// Somewhere a finished prompt can be sent outside the terminal.
class OutputMethod {
public:
    virtual ~OutputMethod() = default;
    virtual std::expected<void, std::string> deliver(const std::string& text) = 0;
};
