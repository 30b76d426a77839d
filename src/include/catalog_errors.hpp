#pragma once

#include "error_context.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace redfish_catalog {

// Base for every error raised by the catalog and its engines.
class CatalogError : public std::runtime_error {
public:
    CatalogError(const std::string& message, const ErrorContext& context = ErrorContext());

    const ErrorContext& Context() const { return context; }

private:
    ErrorContext context;
};

// A namespace, document or type name that no reachable document defines.
class MissingSchemaError : public CatalogError {
public:
    explicit MissingSchemaError(const std::string& name, const std::string& file = std::string());

    const std::string& Name() const { return name; }
    const std::string& File() const { return file; }

private:
    std::string name;
    std::string file;
};

// A base-type chain that loops back onto itself. The cycle lists every
// qualified name on the loop, starting and ending with the same name.
class CircularReferenceError : public CatalogError {
public:
    explicit CircularReferenceError(const std::vector<std::string>& cycle);

    const std::vector<std::string>& Cycle() const { return cycle; }

private:
    std::vector<std::string> cycle;
};

struct DocumentLoadFailure {
    std::string file;
    std::string message;
};

class CatalogLoadError : public CatalogError {
public:
    CatalogLoadError(const std::string& directory, const std::string& reason);
    CatalogLoadError(const std::string& directory, const std::vector<DocumentLoadFailure>& failures);

    const std::string& Directory() const { return directory; }
    const std::vector<DocumentLoadFailure>& Failures() const { return failures; }

private:
    std::string directory;
    std::vector<DocumentLoadFailure> failures;
};

// Raised only when strict checking was requested for a property value.
class PropertyCoercionError : public CatalogError {
public:
    PropertyCoercionError(const std::string& property, const std::string& expected_kind,
                          const std::string& actual_value, const std::string& reason = std::string());

    const std::string& Property() const { return property; }
    const std::string& ExpectedKind() const { return expected_kind; }
    const std::string& ActualValue() const { return actual_value; }

private:
    std::string property;
    std::string expected_kind;
    std::string actual_value;
};

class PayloadParseError : public CatalogError {
public:
    PayloadParseError(const std::string& reason, size_t position);

    size_t Position() const { return position; }

private:
    size_t position;
};

} // namespace redfish_catalog
