/**
 * @file report_collector.cpp
 * @brief ReportCollector implementation.
 */

#include "telemetry/report_collector.hpp"

#include <sstream>
#include <string>
#include <vector>

namespace pipeline_dag {

namespace {

std::string quoted(std::string_view text) {
    return "\"" + json_escape(text) + "\"";
}

std::string name_array(const std::vector<JobName>& names) {
    std::string out = "[";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ',';
        out += pipeline_dag::quoted(names[i]);
    }
    out += ']';
    return out;
}

}  // namespace

ReportCollector::ReportCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void ReportCollector::record_analysis(std::string_view source, const AnalysisResult& result) {
    std::ostringstream oss;
    oss << R"({"event":"analysis")"
        << R"(,"source":)" << quoted(source)
        << R"(,"jobs":)" << result.jobs.size()
        << R"(,"edges":)" << result.edges.size()
        << R"(,"stages":[)";
    for (size_t i = 0; i < result.stages.size(); ++i) {
        if (i > 0) oss << ',';
        oss << name_array(result.stages[i]);
    }
    oss << "]"
        << R"(,"critical_path":)" << name_array(result.critical_path.jobs)
        << R"(,"critical_path_s":)" << result.critical_path.total.count()
        << R"(,"serial_s":)" << result.serial_time.count()
        << R"(,"parallel_s":)" << result.parallel_time.count()
        << R"(,"bottlenecks":)" << name_array(result.bottlenecks)
        << R"(,"issues":)" << result.issues.size()
        << R"(,"suggestions":)" << result.suggestions.size()
        << "}";
    emit(oss.str());

    for (const auto& issue : result.issues) {
        std::ostringstream line;
        line << R"({"event":"issue")"
             << R"(,"source":)" << quoted(source)
             << R"(,"kind":")" << kind(issue) << "\""
             << R"(,"severity":")" << to_string(severity(issue)) << "\""
             << R"(,"message":)" << quoted(describe(issue))
             << "}";
        emit(line.str());
    }

    for (const auto& suggestion : result.suggestions) {
        std::ostringstream line;
        line << R"({"event":"suggestion")"
             << R"(,"source":)" << quoted(source)
             << R"(,"kind":")" << kind(suggestion) << "\""
             << R"(,"severity":")" << to_string(severity(suggestion)) << "\""
             << R"(,"message":)" << quoted(describe(suggestion))
             << "}";
        emit(line.str());
    }
}

void ReportCollector::record_optimization(std::string_view source, const OptimizeResult& result) {
    std::ostringstream oss;
    oss << R"({"event":"optimization")"
        << R"(,"source":)" << quoted(source)
        << R"(,"changes":)" << result.changes.size()
        << R"(,"removed":)" << result.removed_count()
        << "}";
    emit(oss.str());

    for (const auto& change : result.changes) {
        std::ostringstream line;
        line << R"({"event":"change")"
             << R"(,"source":)" << quoted(source)
             << R"(,"job":)" << quoted(change.job)
             << R"(,"reason":")" << to_string(change.reason) << "\""
             << R"(,"removed":)" << name_array(change.removed)
             << "}";
        emit(line.str());
    }
}

void ReportCollector::record_failure(std::string_view source, const Error& error) {
    std::ostringstream oss;
    oss << R"({"event":"failure")"
        << R"(,"source":)" << quoted(source)
        << R"(,"code":")" << to_string(error.code) << "\""
        << R"(,"message":)" << quoted(error.message)
        << "}";
    emit(oss.str());
}

void ReportCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void ReportCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace pipeline_dag
