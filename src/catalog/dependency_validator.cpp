/// @file dependency_validator.cpp
/// @brief Dependency policy implementation

#include <keel/catalog/dependency_validator.hpp>
#include <keel/catalog/service.hpp>
#include <keel/catalog/version.hpp>

namespace keel_catalog {

DependencyReport validate_dependencies(const ServiceRecord& record, const DependencyGraph& graph) {
    DependencyReport report;

    for (const auto& dep : record.dependencies) {
        const std::string* actual = graph.declared_version(dep.target);

        if (!actual) {
            if (dep.required) {
                report.errors.push_back("Required dependency '" + dep.target + "' not found");
            } else {
                report.warnings.push_back("Optional dependency '" + dep.target + "' not found");
            }
            continue;
        }

        if (!dep.version_constraint) {
            continue;
        }

        const std::string& expected = *dep.version_constraint;
        std::string mismatch = "expected " + expected + " but found " + *actual;

        switch (classify(*actual, expected)) {
            case VersionCompatibility::Compatible:
                break;
            case VersionCompatibility::MinorIncompatible:
                report.warnings.push_back("Minor version incompatibility for dependency '" +
                                          dep.target + "': " + mismatch);
                break;
            case VersionCompatibility::MajorIncompatible:
                if (dep.required) {
                    report.errors.push_back("Major version incompatibility for dependency '" +
                                            dep.target + "': " + mismatch);
                } else {
                    report.warnings.push_back("Optional dependency '" + dep.target +
                                              "' has incompatible version: " + mismatch);
                }
                break;
        }
    }

    return report;
}

} // namespace keel_catalog
