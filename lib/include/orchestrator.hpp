#ifndef VERILOOP_ORCHESTRATOR_HPP
#define VERILOOP_ORCHESTRATOR_HPP

#include "classify.hpp"
#include "design.hpp"
#include "diagnostics.hpp"
#include "generation.hpp"
#include "logging.hpp"
#include "module_verifier.hpp"
#include "plan.hpp"
#include "process.hpp"
#include "prompts.hpp"
#include "verify.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace veriloop::lib::flow
{

    // Ready-node queue shared by the worker threads of a parallel run.
    class NodeTaskQueue
    {
    public:
        bool push(std::size_t node);
        // Blocks until a node is available; false once the queue is closed and empty.
        bool waitPop(std::size_t &out);
        void close();
        std::size_t drain();
        bool closed() const noexcept;
        std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<std::size_t> queue_;
        bool closed_ = false;
    };

    struct OrchestratorOptions
    {
        uint32_t maxRetries = 5;
        uint32_t parallelism = 1;
        // Zero means no overall limit.
        std::chrono::milliseconds runBudget{0};
        // Zero uses the runner's own simulation timeout.
        std::chrono::milliseconds simTimeout{0};
    };

    class Orchestrator
    {
    public:
        // `cancel` is shared with the generation client and runner so that an expired budget
        // kills their subprocesses.
        Orchestrator(gen::GenerationClient &client, verify::VerificationRunner &runner,
                     const gen::PromptBuilder &prompts, OrchestratorOptions options,
                     proc::CancellationToken &cancel, Logger *logger = nullptr,
                     diag::Diagnostics *diags = nullptr);

        void setAttemptObserver(AttemptObserver observer) { observer_ = std::move(observer); }

        // Plans, then executes. Planning failures come back as an Aborted result.
        design::DesignResult run(const design::DesignRequest &request);

        // Executes an already validated plan.
        design::DesignResult execute(const plan::DesignPlan &plan);

    private:
        using ResultSlots = std::vector<std::optional<design::ModuleResult>>;

        void expireBudget();
        design::DesignResult executePlan(const plan::DesignPlan &plan);
        design::ModuleResult runNode(ModuleVerifier &verifier, const design::PlanNode &node,
                                     const design::ModuleContext &context);
        void runSerial(const plan::DesignPlan &plan, ModuleVerifier &verifier, design::ModuleContext &context,
                       ResultSlots &results);
        void runParallel(const plan::DesignPlan &plan, ModuleVerifier &verifier, design::ModuleContext &context,
                         ResultSlots &results);
        design::DesignResult compose(const plan::DesignPlan &plan, ResultSlots results) const;

        gen::GenerationClient &client_;
        verify::VerificationRunner &runner_;
        const gen::PromptBuilder &prompts_;
        OrchestratorOptions options_;
        proc::CancellationToken &cancel_;
        Logger *logger_;
        diag::Diagnostics *diags_;
        AttemptObserver observer_;
        classify::DiagnosticClassifier classifier_;
        std::atomic<bool> budgetExpired_{false};
    };

} // namespace veriloop::lib::flow

#endif // VERILOOP_ORCHESTRATOR_HPP
