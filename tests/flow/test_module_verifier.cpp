#include "module_verifier.hpp"
#include "scripted_backends.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace veriloop::lib;
using veriloop::tests::ScriptedClient;
using veriloop::tests::ScriptedRunner;
using design::OutcomeKind;
using design::VerificationOutcome;

namespace
{

    int fail(const std::string &message)
    {
        std::cerr << "[module-verifier-tests] " << message << '\n';
        return 1;
    }

    design::PlanNode makeNode(std::string name, std::vector<std::string> deps = {})
    {
        design::PlanNode node;
        node.name = std::move(name);
        node.description = "test module";
        node.ports = {{"a", 1, design::PortDirection::Input}, {"y", 1, design::PortDirection::Output}};
        node.dependencies = std::move(deps);
        return node;
    }

    struct Fixture
    {
        ScriptedClient client;
        ScriptedRunner runner;
        gen::PromptBuilder prompts;
        classify::DiagnosticClassifier classifier;
        gen::ModuleGenerator generator{client, prompts};

        flow::ModuleVerifier verifier(uint32_t maxRetries)
        {
            return flow::ModuleVerifier(generator, runner, classifier, maxRetries);
        }
    };

} // namespace

int main()
{
    // Passes on the first attempt
    {
        Fixture h;
        flow::ModuleVerifier verifier = h.verifier(5);
        const design::ModuleResult result = verifier.run(makeNode("inv"), {});
        if (result.status != design::ModuleStatus::Verified || result.attemptCount() != 1 || !result.verified)
        {
            return fail("single passing attempt not Verified");
        }
        if (result.verified->interface != makeNode("inv").ports)
        {
            return fail("verified interface does not fall back to the planned ports");
        }
        if (h.client.purposes != std::vector<std::string>{"implement inv", "harness inv"})
        {
            return fail("first attempt requests differ");
        }
    }

    // Exhaustion happens on exactly max_retries attempts
    {
        Fixture h;
        h.runner.script["inv"] = {VerificationOutcome::makeCompileError("inv.v:3: syntax error\n")};
        flow::ModuleVerifier verifier = h.verifier(3);
        const design::ModuleResult result = verifier.run(makeNode("inv"), {});
        if (result.status != design::ModuleStatus::Exhausted || result.attemptCount() != 3 ||
            h.runner.jobs.size() != 3)
        {
            return fail("expected Exhausted after 3 attempts, got " + std::to_string(result.attemptCount()));
        }
        if (result.lastDiagnostic.rfind("SyntaxError: inv.v:3: syntax error", 0) != 0)
        {
            return fail("last diagnostic not carried: " + result.lastDiagnostic);
        }
        for (std::size_t i = 0; i < result.attempts.size(); ++i)
        {
            if (result.attempts[i].index != i + 1 || !result.attempts[i].diagnosis)
            {
                return fail("attempt history incomplete");
            }
        }
    }

    // A compile error repaired on the second and final attempt
    {
        Fixture h;
        h.runner.script["inv"] = {
            VerificationOutcome::makeCompileError("inv.v:2: error: Unknown module type: not_gate\n"),
            VerificationOutcome::makePassed("VLP_PASS v0\nVLP_DONE\n"),
        };
        flow::ModuleVerifier verifier = h.verifier(2);
        const design::ModuleResult result = verifier.run(makeNode("inv"), {});
        if (result.status != design::ModuleStatus::Verified || result.attemptCount() != 2)
        {
            return fail("repair on the last attempt did not verify");
        }
        if (h.client.purposes != std::vector<std::string>{"implement inv", "harness inv", "repair inv"})
        {
            return fail("repair did not reuse the harness");
        }
        const std::string &repairPrompt = h.client.users.back();
        if (repairPrompt.find("UnresolvedReference") == std::string::npos ||
            repairPrompt.find("Unknown module type: not_gate") == std::string::npos ||
            repairPrompt.find(result.attempts[0].implementation) == std::string::npos)
        {
            return fail("repair prompt lacks the diagnosis or the failed code");
        }
        if (result.verified->harness != result.attempts[0].harness ||
            result.verified->implementation == result.attempts[0].implementation)
        {
            return fail("verified candidate does not pair the new design with the old harness");
        }
    }

    // Errors in the harness regenerate the harness only
    {
        Fixture h;
        h.runner.script["inv"] = {
            VerificationOutcome::makeCompileError("tb_inv.v:9: syntax error\n"),
            VerificationOutcome::makePassed("VLP_PASS v0\nVLP_DONE\n"),
        };
        flow::ModuleVerifier verifier = h.verifier(3);
        const design::ModuleResult result = verifier.run(makeNode("inv"), {});
        if (result.status != design::ModuleStatus::Verified ||
            h.client.purposes.back() != "repair-harness inv" ||
            result.verified->implementation != result.attempts[0].implementation)
        {
            return fail("harness repair path not taken");
        }
    }

    // A failed backend call consumes an attempt and the request is repeated
    {
        Fixture h;
        h.client.failures["implement inv"] = 1;
        flow::ModuleVerifier verifier = h.verifier(3);
        const design::ModuleResult result = verifier.run(makeNode("inv"), {});
        if (result.status != design::ModuleStatus::Verified || result.attemptCount() != 2)
        {
            return fail("generation failure not retried");
        }
        if (result.attempts[0].outcome.kind != OutcomeKind::ToolUnavailable || h.runner.jobs.size() != 1)
        {
            return fail("generation failure not recorded as ToolUnavailable");
        }
    }

    // Verified dependencies are handed to the runner, dependency first
    {
        Fixture h;
        design::ContextSnapshot context;
        context.emplace("xor_gate", design::VerifiedModule{"xor_gate", "module xor_gate; endmodule", "", {}, {}});
        context.emplace("half_adder",
                        design::VerifiedModule{"half_adder", "module half_adder; endmodule", "", {}, {"xor_gate"}});
        flow::ModuleVerifier verifier = h.verifier(1);
        const design::ModuleResult result = verifier.run(makeNode("full_adder", {"half_adder"}), context);
        if (result.status != design::ModuleStatus::Verified || h.runner.jobs.size() != 1)
        {
            return fail("module with dependencies did not verify");
        }
        const auto &libraries = h.runner.jobs[0].libraries;
        if (libraries.size() != 2 || libraries[0].name != "xor_gate" || libraries[1].name != "half_adder")
        {
            return fail("dependency closure not passed in dependency order");
        }
        if (h.client.users[0].find("- half_adder (") == std::string::npos)
        {
            return fail("implementation prompt lacks the verified dependency");
        }
    }

    // Observer sees each attempt once
    {
        Fixture h;
        h.runner.script["inv"] = {VerificationOutcome::makeLogicError("VLP_FAIL v0\n", {"VLP_FAIL v0"}),
                                  VerificationOutcome::makePassed("VLP_PASS v0\nVLP_DONE\n")};
        flow::ModuleVerifier verifier = h.verifier(4);
        std::vector<uint32_t> seen;
        verifier.setAttemptObserver([&](const design::PlanNode &, const design::Attempt &attempt) {
            seen.push_back(attempt.index);
        });
        (void)verifier.run(makeNode("inv"), {});
        if (seen != std::vector<uint32_t>{1, 2})
        {
            return fail("observer did not see attempts 1 and 2");
        }
    }

    // Cancellation
    {
        Fixture h;
        proc::CancellationToken token;
        token.cancel();
        flow::ModuleVerifier verifier = h.verifier(3);
        const design::ModuleResult result = verifier.run(makeNode("inv"), {}, &token);
        if (result.status != design::ModuleStatus::Aborted || result.attemptCount() != 0 ||
            !h.client.purposes.empty())
        {
            return fail("cancelled node was attempted");
        }
    }

    // A zero budget is rejected
    {
        Fixture h;
        try
        {
            (void)h.verifier(0);
            return fail("max_retries = 0 accepted");
        }
        catch (const std::invalid_argument &)
        {
        }
    }

    return 0;
}
