/**
 * @file job_file.cpp
 * @brief TOML job file parsing using toml++.
 */

#include "workload/job_file.hpp"

#include <toml++/toml.hpp>

#include <format>
#include <optional>
#include <string>

namespace pipeline_dag {

namespace {

Error invalid(std::string message) {
    return Error{ErrorCode::InvalidInput, std::move(message)};
}

Result<NeedsDeclaration> parse_needs(const std::string& job, const toml::node* node) {
    if (node == nullptr) return NeedsDeclaration{};

    if (auto name = node->value<std::string>()) {
        return NeedsDeclaration{*name};
    }

    if (const auto* arr = node->as_array()) {
        NeedsList list;
        for (const auto& element : *arr) {
            if (auto name = element.value<std::string>()) {
                list.emplace_back(*name);
            } else if (const auto* entry_tbl = element.as_table()) {
                NeedsEntry entry;
                entry.job = (*entry_tbl)["job"].value<std::string>();
                entry.artifacts = (*entry_tbl)["artifacts"].value_or(true);
                entry.optional = (*entry_tbl)["optional"].value_or(false);
                list.emplace_back(std::move(entry));
            } else {
                return invalid(std::format("jobs.{}.needs: list entries must be strings or tables",
                                           job));
            }
        }
        return NeedsDeclaration{std::move(list)};
    }

    if (const auto* tbl = node->as_table()) {
        NeedsMap mapping;
        for (auto&& [key, value] : *tbl) {
            mapping.emplace(std::string{key.str()}, value.value<std::string>().value_or(""));
        }
        return NeedsDeclaration{std::move(mapping)};
    }

    return invalid(std::format("jobs.{}.needs: expected a string, list or table", job));
}

Result<Step> parse_step(const std::string& job, size_t index, const toml::node& node) {
    const auto* tbl = node.as_table();
    if (tbl == nullptr) {
        return invalid(std::format("jobs.{}.steps[{}]: expected a table", job, index));
    }

    Step step;
    step.name = (*tbl)["name"].value_or(std::string{});
    step.uses = (*tbl)["uses"].value_or(std::string{});
    step.run = (*tbl)["run"].value_or(std::string{});

    if (const auto* with = (*tbl)["with"].as_table()) {
        for (auto&& [key, value] : *with) {
            auto text = value.value<std::string>();
            if (!text) {
                return invalid(std::format("jobs.{}.steps[{}].with.{}: expected a string",
                                           job, index, key.str()));
            }
            step.with.emplace(std::string{key.str()}, std::move(*text));
        }
    }
    return step;
}

Result<JobMap> from_table(const toml::table& root) {
    const auto* jobs_tbl = root["jobs"].as_table();
    if (jobs_tbl == nullptr) {
        return invalid("Missing [jobs] table");
    }

    JobMap jobs;
    for (auto&& [key, node] : *jobs_tbl) {
        std::string name{key.str()};
        const auto* job_tbl = node.as_table();
        if (job_tbl == nullptr) {
            return invalid(std::format("jobs.{}: expected a table", name));
        }

        Job job;
        job.name = name;
        job.runs_on = (*job_tbl)["runs_on"].value_or(std::string{});

        auto needs = parse_needs(name, job_tbl->get("needs"));
        if (!needs) return needs.error();
        job.needs = std::move(*needs);

        if (const auto* steps_node = job_tbl->get("steps")) {
            const auto* steps = steps_node->as_array();
            if (steps == nullptr) {
                return invalid(std::format("jobs.{}.steps: expected an array", name));
            }
            for (size_t i = 0; i < steps->size(); ++i) {
                auto step = parse_step(name, i, *steps->get(i));
                if (!step) return step.error();
                job.steps.push_back(std::move(*step));
            }
        }

        jobs.emplace(name, std::move(job));
    }
    return jobs;
}

}  // namespace

Result<JobMap> load_job_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Job file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return invalid(std::string{"TOML parse error in "} + path.string() + ": "
                       + std::string{err.description()});
    }
}

Result<JobMap> parse_job_file(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return invalid(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

}  // namespace pipeline_dag
