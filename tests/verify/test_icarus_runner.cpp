#include "classify.hpp"
#include "verify.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#ifndef VERILOOP_TEST_DATA_DIR
#error "VERILOOP_TEST_DATA_DIR must be defined"
#endif
#ifndef VERILOOP_TEST_ARTIFACT_DIR
#error "VERILOOP_TEST_ARTIFACT_DIR must be defined"
#endif

using namespace veriloop::lib;
using design::OutcomeKind;

namespace
{

    int fail(const std::string &message)
    {
        std::cerr << "[icarus-runner-tests] " << message << '\n';
        return 1;
    }

    // The stand-in toolchain scripts are run through sh so they need no execute bit.
    verify::ToolchainOptions stubToolchain(const std::filesystem::path &workRoot)
    {
        const std::filesystem::path data = std::filesystem::path(VERILOOP_TEST_DATA_DIR) / "toolchain";
        verify::ToolchainOptions options;
        options.compiler = "sh";
        options.compileFlags = {(data / "fake_iverilog.sh").string()};
        options.simulator = "sh";
        options.simFlags = {(data / "fake_vvp.sh").string()};
        options.compileTimeout = std::chrono::milliseconds(10000);
        options.simTimeout = std::chrono::milliseconds(10000);
        options.interfaceCheck = false;
        options.workRoot = workRoot;
        return options;
    }

    verify::VerificationJob job(std::string harness)
    {
        verify::VerificationJob result;
        result.module = "adder";
        result.implementation = "module adder(input a, input b, output s);\n  assign s = a ^ b;\nendmodule\n";
        result.harness = std::move(harness);
        return result;
    }

    const char *kPassingHarness = "module tb_adder;\n"
                                  "// SIM: VLP_PASS a=0 b=0\n"
                                  "// SIM: VLP_PASS a=1 b=0\n"
                                  "// SIM: VLP_DONE\n"
                                  "endmodule\n";

} // namespace

int main()
{
    const std::filesystem::path workRoot = std::filesystem::path(VERILOOP_TEST_ARTIFACT_DIR) / "icarus-runner";
    std::filesystem::remove_all(workRoot);

    // Passing run, with dependency files written beside the design
    {
        verify::IcarusRunner runner(stubToolchain(workRoot));
        verify::VerificationJob passing = job(kPassingHarness);
        passing.libraries.push_back(verify::SourceFile{"xor_gate", "module xor_gate; endmodule\n"});
        const design::VerificationOutcome outcome = runner.verify(passing);
        if (outcome.kind != OutcomeKind::Passed)
        {
            return fail(std::string("expected Passed, got ") + design::toString(outcome.kind) + ": " +
                        outcome.diagnostic);
        }
        const std::filesystem::path dir = workRoot / "adder" / "run-0000";
        for (const char *file : {"adder.v", "tb_adder.v", "xor_gate.v", "sim.vvp"})
        {
            if (!std::filesystem::exists(dir / file))
            {
                return fail(std::string("missing work file ") + file);
            }
        }
    }

    // Repeating a job gives the same outcome in a fresh directory each time
    {
        const std::filesystem::path repeatRoot = workRoot / "repeat";
        verify::IcarusRunner runner(stubToolchain(repeatRoot));
        const verify::VerificationJob failing = job("module tb_adder;\n"
                                                    "// SIM: VLP_PASS a=0 b=0\n"
                                                    "// SIM: VLP_FAIL a=1 b=1 expected=0 got=1\n"
                                                    "// SIM: VLP_DONE\n"
                                                    "endmodule\n");
        for (const verify::VerificationJob &repeated : {job(kPassingHarness), failing})
        {
            std::filesystem::remove_all(repeatRoot);
            const design::VerificationOutcome first = runner.verify(repeated);
            const design::VerificationOutcome second = runner.verify(repeated);
            if (first.kind != second.kind || first.failingVectors != second.failingVectors)
            {
                return fail(std::string("repeated job changed outcome: ") + design::toString(first.kind) + " then " +
                            design::toString(second.kind));
            }

            std::vector<std::filesystem::path> runs;
            for (const auto &entry : std::filesystem::directory_iterator(repeatRoot / "adder"))
            {
                runs.push_back(entry.path());
            }
            if (runs.size() != 2)
            {
                return fail("expected two work directories, found " + std::to_string(runs.size()));
            }
            for (const std::filesystem::path &run : runs)
            {
                if (!std::filesystem::exists(run / "adder.v") || !std::filesystem::exists(run / "tb_adder.v"))
                {
                    return fail("work directory " + run.string() + " lacks its own sources");
                }
            }
        }
    }

    // Compile error keeps the compiler output for classification
    {
        verify::IcarusRunner runner(stubToolchain(workRoot));
        verify::VerificationJob broken = job(kPassingHarness);
        broken.implementation = "module adder(input a, input b, output s);\n  SYNTAX_BROKEN\nendmodule\n";
        const design::VerificationOutcome outcome = runner.verify(broken);
        if (outcome.kind != OutcomeKind::CompileError)
        {
            return fail(std::string("expected CompileError, got ") + design::toString(outcome.kind));
        }
        const design::Diagnosis diagnosis = classify::DiagnosticClassifier().classify(outcome);
        if (diagnosis.category != design::FailureCategory::SyntaxError || diagnosis.file != "adder.v" ||
            diagnosis.line != 2)
        {
            return fail("compile error not located at adder.v:2: " + diagnosis.evidence);
        }
    }

    // Failing vector
    {
        verify::IcarusRunner runner(stubToolchain(workRoot));
        const design::VerificationOutcome outcome = runner.verify(job("module tb_adder;\n"
                                                                      "// SIM: VLP_PASS a=0 b=0\n"
                                                                      "// SIM: VLP_FAIL a=1 b=1 expected=0 got=1\n"
                                                                      "// SIM: VLP_DONE\n"
                                                                      "endmodule\n"));
        if (outcome.kind != OutcomeKind::LogicError || outcome.failingVectors.size() != 1)
        {
            return fail(std::string("expected LogicError, got ") + design::toString(outcome.kind));
        }
    }

    // Missing completion marker
    {
        verify::IcarusRunner runner(stubToolchain(workRoot));
        const design::VerificationOutcome outcome =
            runner.verify(job("module tb_adder;\n// SIM: VLP_PASS a=0 b=0\nendmodule\n"));
        if (outcome.kind != OutcomeKind::Timeout)
        {
            return fail(std::string("expected Timeout, got ") + design::toString(outcome.kind));
        }
    }

    // Hanging simulation is killed at the job's limit
    {
        verify::IcarusRunner runner(stubToolchain(workRoot));
        verify::VerificationJob hanging = job("module tb_adder;\n// SIM_HANG\nendmodule\n");
        hanging.simTimeout = std::chrono::milliseconds(300);
        const auto start = std::chrono::steady_clock::now();
        const design::VerificationOutcome outcome = runner.verify(hanging);
        if (outcome.kind != OutcomeKind::Timeout)
        {
            return fail(std::string("expected Timeout for hang, got ") + design::toString(outcome.kind));
        }
        if (std::chrono::steady_clock::now() - start > std::chrono::seconds(5))
        {
            return fail("hanging simulation not killed promptly");
        }
    }

    // Missing compiler
    {
        verify::ToolchainOptions options = stubToolchain(workRoot);
        options.compiler = "veriloop-missing-iverilog";
        verify::IcarusRunner runner(options);
        const design::VerificationOutcome outcome = runner.verify(job(kPassingHarness));
        if (outcome.kind != OutcomeKind::ToolUnavailable)
        {
            return fail(std::string("expected ToolUnavailable, got ") + design::toString(outcome.kind));
        }
    }

    // Cancelled before compiling
    {
        verify::IcarusRunner runner(stubToolchain(workRoot));
        proc::CancellationToken token;
        token.cancel();
        verify::VerificationJob cancelled = job(kPassingHarness);
        cancelled.cancel = &token;
        const design::VerificationOutcome outcome = runner.verify(cancelled);
        if (outcome.kind != OutcomeKind::Timeout)
        {
            return fail(std::string("cancelled job not reported as Timeout, got ") +
                        design::toString(outcome.kind));
        }
    }

    return 0;
}
