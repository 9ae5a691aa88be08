/**
 * @file batch_analyzer.cpp
 * @brief BatchAnalyzer implementation on top of ThreadPool.
 */

#include "engine/batch_analyzer.hpp"

#include <format>
#include <future>
#include <memory>

namespace pipeline_dag {

namespace {

BatchOutcome analyze_one(const DagAnalyzer& analyzer, const PipelineInput& input,
                         bool with_optimization) {
    BatchOutcome outcome;
    outcome.source = input.source;

    auto analysis = analyzer.analyze(input.jobs);
    if (!analysis) {
        outcome.error = analysis.error();
        return outcome;
    }
    outcome.analysis = std::move(*analysis);

    if (with_optimization) {
        auto optimized = analyzer.optimize(input.jobs);
        if (!optimized) {
            outcome.error = optimized.error();
            return outcome;
        }
        outcome.optimization = std::move(*optimized);
    }
    return outcome;
}

}  // namespace

BatchAnalyzer::BatchAnalyzer(const Config& config, Logger* logger)
    : config_(config)
    , logger_(logger)
    , pool_(std::make_unique<ThreadPool>(config.performance.max_workers)) {}

std::chrono::milliseconds BatchAnalyzer::timeout_per_file() const noexcept {
    return std::chrono::milliseconds{config_.performance.timeout_per_file_ms};
}

std::vector<BatchOutcome> BatchAnalyzer::run(std::vector<PipelineInput> inputs,
                                             bool with_optimization) const {
    struct Pending {
        std::string source;
        std::future<void> started;
        std::future<BatchOutcome> done;
    };

    DagAnalyzer analyzer(config_, logger_);
    std::vector<Pending> pending;
    pending.reserve(inputs.size());

    for (auto& input : inputs) {
        auto shared_input = std::make_shared<const PipelineInput>(std::move(input));
        auto started = std::make_shared<std::promise<void>>();

        Pending entry;
        entry.source = shared_input->source;
        entry.started = started->get_future();
        entry.done = pool_->submit([analyzer, shared_input, started, with_optimization] {
            started->set_value();
            return analyze_one(analyzer, *shared_input, with_optimization);
        });
        pending.push_back(std::move(entry));
    }

    std::vector<BatchOutcome> outcomes;
    outcomes.reserve(pending.size());

    for (auto& entry : pending) {
        entry.started.wait();
        bool bounded = timeout_per_file().count() > 0;
        if (bounded && entry.done.wait_for(timeout_per_file()) != std::future_status::ready) {
            if (logger_ != nullptr) {
                logger_->warn(std::format("Analysis of {} exceeded {} ms; marked incomplete",
                                          entry.source, timeout_per_file().count()));
            }
            BatchOutcome incomplete;
            incomplete.source = entry.source;
            incomplete.error = Error{ErrorCode::Timeout, "analysis incomplete"};
            outcomes.push_back(std::move(incomplete));
            continue;
        }

        auto outcome = entry.done.get();
        if (!outcome.ok() && logger_ != nullptr) {
            logger_->error(std::format("Analysis of {} failed: {}",
                                       outcome.source, outcome.error->message));
        }
        outcomes.push_back(std::move(outcome));
    }

    return outcomes;
}

}  // namespace pipeline_dag
