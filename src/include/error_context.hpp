#pragma once

#include <string>
#include <utility>
#include <vector>

namespace redfish_catalog {

/**
 * Error Context Helper
 *
 * Collects the qualified names, files and property paths that make a catalog
 * diagnostic actionable. Entries keep their insertion order so messages read
 * the same way they were built.
 *
 * Usage:
 *   ErrorContext ctx;
 *   ctx.Set("type", "Example.v1_0_0.Example")
 *      .Set("file", "Example_v1.xml");
 *   throw MissingSchemaError(..., ctx);
 */
class ErrorContext {
public:
    ErrorContext() = default;

    /**
     * Set a context variable. Setting an existing key replaces its value in place.
     *
     * @return Reference to this context (for chaining)
     */
    ErrorContext& Set(const std::string& key, const std::string& value);

    /**
     * @return The context value, or empty string if not set
     */
    std::string Get(const std::string& key) const;

    bool Has(const std::string& key) const;

    /**
     * Build a formatted error message with context
     *
     * Example:
     *   ctx.Set("property", "Status.Health").Set("file", "Example_v1.xml");
     *   ctx.Format("Coercion failed");
     *   // Returns: "Coercion failed [property: Status.Health, file: Example_v1.xml]"
     */
    std::string Format(const std::string& base_message) const;

    void Clear();
    bool IsEmpty() const;

    const std::vector<std::pair<std::string, std::string>>& Entries() const { return entries_; }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

} // namespace redfish_catalog
