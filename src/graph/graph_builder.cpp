/**
 * @file graph_builder.cpp
 * @brief Needs normalization and graph construction.
 */

#include "graph/graph_builder.hpp"

#include <algorithm>

namespace pipeline_dag {

namespace {

// Appends `name` unless already present. Returns false on an empty name.
bool append_name(std::vector<JobName>& names, const std::string& name) {
    if (name.empty()) return false;
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
    return true;
}

}  // namespace

Result<std::vector<JobName>> normalize_needs(const NeedsDeclaration& needs) {
    std::vector<JobName> names;

    if (const auto* single = std::get_if<std::string>(&needs)) {
        if (!append_name(names, *single)) {
            return make_error<std::vector<JobName>>(ErrorCode::ContractViolation,
                                                    "Empty dependency name");
        }
    } else if (const auto* list = std::get_if<NeedsList>(&needs)) {
        for (const auto& item : *list) {
            if (const auto* name = std::get_if<std::string>(&item)) {
                if (!append_name(names, *name)) {
                    return make_error<std::vector<JobName>>(ErrorCode::ContractViolation,
                                                            "Empty dependency name in needs list");
                }
                continue;
            }
            const auto& entry = std::get<NeedsEntry>(item);
            if (!entry.job) {
                return make_error<std::vector<JobName>>(ErrorCode::ContractViolation,
                                                        "Needs entry without a 'job' field");
            }
            if (!append_name(names, *entry.job)) {
                return make_error<std::vector<JobName>>(ErrorCode::ContractViolation,
                                                        "Needs entry with an empty 'job' field");
            }
        }
    } else if (const auto* mapping = std::get_if<NeedsMap>(&needs)) {
        for (const auto& [name, _] : *mapping) {
            if (!append_name(names, name)) {
                return make_error<std::vector<JobName>>(ErrorCode::ContractViolation,
                                                        "Empty dependency name in needs mapping");
            }
        }
    }

    return names;
}

Result<BuiltGraph> GraphBuilder::build(const JobMap& jobs) {
    DependencyMap declared;

    for (const auto& [key, job] : jobs) {
        if (key.empty()) {
            return Error{ErrorCode::ContractViolation, "Job with an empty name"};
        }
        if (job.name != key) {
            return Error{ErrorCode::ContractViolation,
                         "Job record '" + job.name + "' stored under key '" + key + "'"};
        }

        auto names = normalize_needs(job.needs);
        if (!names) {
            return Error{names.error().code,
                         "Job '" + key + "': " + names.error().message};
        }
        declared.emplace(key, std::move(*names));
    }

    return build(declared);
}

BuiltGraph GraphBuilder::build(const DependencyMap& declared) {
    BuiltGraph built;
    built.declared = declared;

    for (const auto& [name, _] : declared) {
        built.graph.add_node(name);
    }

    for (const auto& [name, needs] : declared) {
        for (const auto& dependency : needs) {
            if (built.graph.has_node(dependency)) {
                built.graph.add_edge(dependency, name);
            } else {
                built.missing.emplace_back(MissingDependency{name, dependency});
            }
        }
    }

    return built;
}

}  // namespace pipeline_dag
