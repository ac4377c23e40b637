#pragma once

#include <string>

namespace processing
{

// Text transform applied to free-text fields after reflow,
// e.g. Simplified -> Hong Kong Traditional Chinese.
class IScriptConverter
{
public:
    virtual ~IScriptConverter() = default;

    [[nodiscard]] virtual std::string convert(const std::string& text) const = 0;

    // Short identifier used in logs
    [[nodiscard]] virtual std::string name() const = 0;
};

class IdentityScriptConverter : public IScriptConverter
{
public:
    [[nodiscard]] std::string convert(const std::string& text) const override { return text; }

    [[nodiscard]] std::string name() const override { return "identity"; }
};

} // namespace processing
