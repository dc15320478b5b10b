#pragma once

/// @file dependency_validator.hpp
/// @brief Per-service dependency policy
///
/// | target present | constraint | compatibility     | required | outcome |
/// |----------------|------------|-------------------|----------|---------|
/// | no             |            |                   | yes      | error   |
/// | no             |            |                   | no       | warning |
/// | yes            | none       |                   | any      | -       |
/// | yes            | yes        | Compatible        | any      | -       |
/// | yes            | yes        | MinorIncompatible | any      | warning |
/// | yes            | yes        | MajorIncompatible | yes      | error   |
/// | yes            | yes        | MajorIncompatible | no       | warning |

#include "fwd.hpp"
#include "dependency_graph.hpp"

#include <string>
#include <vector>

namespace keel_catalog {

struct DependencyReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] bool has_errors() const noexcept { return !errors.empty(); }
};

/// Apply the dependency policy to one record
///
/// Presence and actual versions come from the graph nodes, so the graph must
/// be built from the same record set.
[[nodiscard]] DependencyReport validate_dependencies(const ServiceRecord& record, const DependencyGraph& graph);

} // namespace keel_catalog
