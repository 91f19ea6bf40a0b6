#include "module_verifier.hpp"

#include <stdexcept>

namespace veriloop::lib::flow
{

    namespace
    {

        bool isCancelled(const proc::CancellationToken *cancel)
        {
            return cancel && cancel->cancelled();
        }

        std::string describeDiagnosis(const design::Diagnosis &diagnosis)
        {
            std::string text = design::toString(diagnosis.category);
            if (!diagnosis.file.empty())
            {
                text.append(" at ");
                text.append(diagnosis.file);
                text.push_back(':');
                text.append(std::to_string(diagnosis.line));
            }
            if (diagnosis.harnessImplicated)
            {
                text.append(" (harness)");
            }
            return text;
        }

    } // namespace

    const char *toString(VerifierState state) noexcept
    {
        switch (state)
        {
        case VerifierState::Init:
            return "Init";
        case VerifierState::Generating:
            return "Generating";
        case VerifierState::Verifying:
            return "Verifying";
        case VerifierState::Diagnosing:
            return "Diagnosing";
        case VerifierState::Passed:
            return "Passed";
        case VerifierState::Exhausted:
            return "Exhausted";
        case VerifierState::Aborted:
        default:
            return "Aborted";
        }
    }

    ModuleVerifier::ModuleVerifier(gen::ModuleGenerator &generator, verify::VerificationRunner &runner,
                                   const classify::DiagnosticClassifier &classifier, uint32_t maxRetries,
                                   Logger *logger)
        : generator_(generator), runner_(runner), classifier_(classifier), maxRetries_(maxRetries), logger_(logger)
    {
        if (maxRetries_ == 0)
        {
            throw std::invalid_argument("max_retries must be at least 1");
        }
    }

    const design::Attempt &ModuleVerifier::record(design::ModuleResult &result, const design::PlanNode &node,
                                                  uint32_t index, gen::Candidate candidate,
                                                  design::VerificationOutcome outcome)
    {
        design::Attempt attempt;
        attempt.index = index;
        attempt.implementation = std::move(candidate.implementation);
        attempt.harness = std::move(candidate.harness);
        attempt.outcome = std::move(outcome);
        if (!attempt.outcome.passed())
        {
            attempt.diagnosis = classifier_.classify(attempt.outcome);
        }
        result.attempts.push_back(std::move(attempt));
        const design::Attempt &stored = result.attempts.back();

        std::string message = node.name + ": attempt " + std::to_string(index) + "/" +
                              std::to_string(maxRetries_) + " -> " + design::toString(stored.outcome.kind);
        if (stored.diagnosis)
        {
            message.append(" [");
            message.append(describeDiagnosis(*stored.diagnosis));
            message.push_back(']');
        }
        logTo(logger_, stored.outcome.passed() ? LogLevel::Info : LogLevel::Warn, "module", message);
        if (observer_)
        {
            observer_(node, stored);
        }
        return stored;
    }

    design::ModuleResult ModuleVerifier::run(const design::PlanNode &node, const design::ContextSnapshot &context,
                                             const proc::CancellationToken *cancel)
    {
        design::ModuleResult result;
        result.node = node.name;

        const std::vector<const design::VerifiedModule *> dependencies = design::dependencyClosure(node, context);
        std::vector<verify::SourceFile> libraries;
        libraries.reserve(dependencies.size());
        for (const design::VerifiedModule *dep : dependencies)
        {
            libraries.push_back(verify::SourceFile{dep->name, dep->implementation});
        }

        VerifierState state = VerifierState::Init;
        uint32_t index = 0;
        std::optional<gen::RepairContext> repair;
        gen::Candidate candidate;

        while (true)
        {
            switch (state)
            {
            case VerifierState::Init:
                logTo(logger_, LogLevel::Info, "module",
                      node.name + ": start (" + std::to_string(dependencies.size()) + " verified dependencies)");
                state = VerifierState::Generating;
                break;

            case VerifierState::Generating:
            {
                if (isCancelled(cancel))
                {
                    state = VerifierState::Aborted;
                    break;
                }
                ++index;
                gen::Candidate partial;
                try
                {
                    candidate = generator_.generate(node, dependencies, repair, &partial);
                    state = VerifierState::Verifying;
                }
                catch (const gen::GenerationError &ex)
                {
                    record(result, node, index, std::move(partial),
                           design::VerificationOutcome::makeToolUnavailable(std::string("generation failed: ") +
                                                                            ex.what()));
                    if (isCancelled(cancel))
                    {
                        state = VerifierState::Aborted;
                    }
                    else
                    {
                        state = index >= maxRetries_ ? VerifierState::Exhausted : VerifierState::Diagnosing;
                    }
                }
                break;
            }

            case VerifierState::Verifying:
            {
                const verify::VerificationJob job{
                    .module = node.name,
                    .expectedPorts = node.ports,
                    .implementation = candidate.implementation,
                    .harness = candidate.harness,
                    .libraries = libraries,
                    .simTimeout = simTimeout_,
                    .cancel = cancel,
                };
                design::VerificationOutcome outcome = runner_.verify(job);
                const design::Attempt &attempt = record(result, node, index, std::move(candidate), std::move(outcome));
                candidate = {};
                if (attempt.outcome.passed())
                {
                    state = VerifierState::Passed;
                }
                else if (isCancelled(cancel))
                {
                    state = VerifierState::Aborted;
                }
                else
                {
                    state = index >= maxRetries_ ? VerifierState::Exhausted : VerifierState::Diagnosing;
                }
                break;
            }

            case VerifierState::Diagnosing:
            {
                // Analysis only: the attempt was already consumed and classified when recorded.
                const design::Attempt &last = result.attempts.back();
                if (last.outcome.kind == design::OutcomeKind::ToolUnavailable)
                {
                    // Nothing to learn from the candidate; repeat the previous request.
                    state = VerifierState::Generating;
                    break;
                }
                repair = gen::RepairContext{
                    .failedAttempt = last.index,
                    .previousImplementation = last.implementation,
                    .previousHarness = last.harness,
                    .diagnosis = last.diagnosis.value_or(design::Diagnosis{}),
                };
                state = VerifierState::Generating;
                break;
            }

            case VerifierState::Passed:
            {
                const design::Attempt &passed = result.attempts.back();
                design::VerifiedModule verified;
                verified.name = node.name;
                verified.implementation = passed.implementation;
                verified.harness = passed.harness;
                verified.interface = passed.outcome.interface.value_or(node.ports);
                verified.dependencies = node.dependencies;
                result.verified = std::move(verified);
                result.status = design::ModuleStatus::Verified;
                logTo(logger_, LogLevel::Info, "module",
                      node.name + ": verified after " + std::to_string(result.attemptCount()) + " attempt(s)");
                return result;
            }

            case VerifierState::Exhausted:
            {
                const design::Attempt &last = result.attempts.back();
                result.status = design::ModuleStatus::Exhausted;
                if (last.diagnosis)
                {
                    result.lastDiagnostic = std::string(design::toString(last.diagnosis->category)) + ": " +
                                            last.diagnosis->evidence;
                }
                else
                {
                    result.lastDiagnostic = last.outcome.diagnostic;
                }
                logTo(logger_, LogLevel::Error, "module",
                      node.name + ": exhausted after " + std::to_string(result.attemptCount()) + " attempt(s)");
                return result;
            }

            case VerifierState::Aborted:
            default:
                result.status = design::ModuleStatus::Aborted;
                result.reason = "cancelled after " + std::to_string(result.attemptCount()) + " attempt(s)";
                logTo(logger_, LogLevel::Warn, "module", node.name + ": " + result.reason);
                return result;
            }
        }
    }

} // namespace veriloop::lib::flow
