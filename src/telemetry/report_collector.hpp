/**
 * @file report_collector.hpp
 * @brief Structured NDJSON reports of analysis and optimization outcomes.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "engine/dag_analyzer.hpp"
#include "optimize/changes.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace pipeline_dag {

/**
 * @brief Serializes engine results as one JSON event per line.
 *
 * Event types: "analysis", "issue", "suggestion", "optimization", "change"
 * and "failure". Every event carries the "source" it was produced for.
 */
class ReportCollector {
public:
    explicit ReportCollector(std::unique_ptr<ILogSink> sink);

    void record_analysis(std::string_view source, const AnalysisResult& result);
    void record_optimization(std::string_view source, const OptimizeResult& result);
    void record_failure(std::string_view source, const Error& error);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace pipeline_dag
