#pragma once

#include "flowpack/component_resolver.hpp"
#include "flowpack/types.hpp"

#include <memory>
#include <vector>

namespace flowpack {

// Validates resolved node configuration against the JSON Schema each
// component declares. Schemas are compiled once per component and cached
// for the validator's lifetime.
class SchemaValidator {
public:
    explicit SchemaValidator(const ComponentResolver& resolver);
    ~SchemaValidator();

    SchemaValidator(const SchemaValidator&) = delete;
    SchemaValidator& operator=(const SchemaValidator&) = delete;

    // One error per violation; empty when the configuration is valid or the
    // component has no schema. A schema that fails to compile yields a
    // single error.
    std::vector<NodeSchemaError> validate(const ResolvedNode& node);

    // Validate every node and aggregate the errors in node order
    std::vector<NodeSchemaError> validate_all(const std::vector<ResolvedNode>& nodes);

private:
    class Cache;

    const ComponentResolver& resolver_;
    std::unique_ptr<Cache> cache_;
};

// Payload the schema applies to. component.exec wrappers drop their
// `component` reference.
json schema_instance(const ResolvedNode& node);

// "- node `id` (component) pointer: message"
std::string format_schema_error(const NodeSchemaError& error);

} // namespace flowpack
