#ifndef VERILOOP_MODULE_VERIFIER_HPP
#define VERILOOP_MODULE_VERIFIER_HPP

#include "classify.hpp"
#include "design.hpp"
#include "generation.hpp"
#include "logging.hpp"
#include "process.hpp"
#include "verify.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace veriloop::lib::flow
{

    enum class VerifierState
    {
        Init,
        Generating,
        Verifying,
        Diagnosing,
        Passed,
        Exhausted,
        Aborted
    };

    const char *toString(VerifierState state) noexcept;

    // Called once per recorded attempt, from the thread running the node.
    using AttemptObserver = std::function<void(const design::PlanNode &, const design::Attempt &)>;

    // Bounded generate / verify / diagnose loop for one plan node. `maxRetries` is the total
    // number of attempts; exhaustion happens on exactly that attempt.
    class ModuleVerifier
    {
    public:
        ModuleVerifier(gen::ModuleGenerator &generator, verify::VerificationRunner &runner,
                       const classify::DiagnosticClassifier &classifier, uint32_t maxRetries,
                       Logger *logger = nullptr);

        void setAttemptObserver(AttemptObserver observer) { observer_ = std::move(observer); }
        void setSimulationTimeout(std::chrono::milliseconds timeout) { simTimeout_ = timeout; }

        // `context` must hold every dependency of `node`. Never throws for generation or tool
        // failures; a cancelled token ends the node Aborted.
        design::ModuleResult run(const design::PlanNode &node, const design::ContextSnapshot &context,
                                 const proc::CancellationToken *cancel = nullptr);

        uint32_t maxRetries() const noexcept { return maxRetries_; }

    private:
        const design::Attempt &record(design::ModuleResult &result, const design::PlanNode &node, uint32_t index,
                                      gen::Candidate candidate, design::VerificationOutcome outcome);

        gen::ModuleGenerator &generator_;
        verify::VerificationRunner &runner_;
        const classify::DiagnosticClassifier &classifier_;
        uint32_t maxRetries_;
        std::chrono::milliseconds simTimeout_{0};
        Logger *logger_;
        AttemptObserver observer_;
    };

} // namespace veriloop::lib::flow

#endif // VERILOOP_MODULE_VERIFIER_HPP
