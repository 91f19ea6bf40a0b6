#include "classify.hpp"

#include <iostream>
#include <string>

using namespace veriloop::lib;
using design::FailureCategory;

namespace
{

    int fail(const std::string &message)
    {
        std::cerr << "[classify-tests] " << message << '\n';
        return 1;
    }

} // namespace

int main()
{
    const classify::DiagnosticClassifier classifier;

    // Icarus syntax error in the design
    {
        const design::Diagnosis d = classifier.classify("adder.v:7: syntax error\n"
                                                        "adder.v:7: error: Invalid module item.\n",
                                                        classify::Phase::Compile);
        if (d.category != FailureCategory::SyntaxError)
        {
            return fail(std::string("expected SyntaxError, got ") + design::toString(d.category));
        }
        if (d.file != "adder.v" || d.line != 7 || d.harnessImplicated)
        {
            return fail("syntax error location wrong: " + d.file + ":" + std::to_string(d.line));
        }
        if (d.evidence.find("adder.v:7: syntax error") != 0)
        {
            return fail("evidence does not start at the located line: " + d.evidence);
        }
    }

    // Unknown module type points into the harness
    {
        const design::Diagnosis d =
            classifier.classify("tb_full_adder.v:12: error: Unknown module type: half_addr\n"
                                "1 error(s) during elaboration.\n",
                                classify::Phase::Compile);
        if (d.category != FailureCategory::UnresolvedReference || d.file != "tb_full_adder.v" || d.line != 12)
        {
            return fail("unresolved reference not located in the harness");
        }
        if (!d.harnessImplicated)
        {
            return fail("harness not implicated for tb_ file");
        }
    }

    // Warnings before the first error are skipped
    {
        const design::Diagnosis d =
            classifier.classify("counter.v:3: warning: implicit definition of wire 'x'.\n"
                                "counter.v:9: error: Unable to bind wire/reg/memory `cnt' in `counter'\n",
                                classify::Phase::Compile);
        if (d.category != FailureCategory::UnresolvedReference || d.line != 9)
        {
            return fail("warning line was taken as the first error");
        }
    }

    // Port mismatch wins over later phrases
    {
        const design::Diagnosis d =
            classifier.classify("alu.v:1: error: port mismatch: port 'op' expected input [2:0] but found input [1:0]\n"
                                "expected ports: input [2:0] op\n",
                                classify::Phase::Compile);
        if (d.category != FailureCategory::PortMismatch)
        {
            return fail(std::string("expected PortMismatch, got ") + design::toString(d.category));
        }
    }

    // Icarus instantiation errors
    {
        const design::Diagnosis count =
            classifier.classify("full_adder.v:9: error: Wrong number of ports. Expecting 2, got 3.\n"
                                "1 error(s) during elaboration.\n",
                                classify::Phase::Compile);
        if (count.category != FailureCategory::PortMismatch || count.file != "full_adder.v" || count.line != 9)
        {
            return fail(std::string("port count error not PortMismatch, got ") + design::toString(count.category));
        }

        const design::Diagnosis named =
            classifier.classify("tb_adder.v:14: warning: Port 2 (b) of adder expects 4 bits, got 1.\n"
                                "tb_adder.v:14:        : Padding 3 high bits of the port.\n"
                                "tb_adder.v:15: error: port ``cin'' is not a port of adder.\n"
                                "1 error(s) during elaboration.\n",
                                classify::Phase::Compile);
        if (named.category != FailureCategory::PortMismatch || named.line != 15 || !named.harnessImplicated)
        {
            return fail("unknown named port not located as a harness PortMismatch");
        }

        const design::Diagnosis width =
            classifier.classify("adder_top.v:6: warning: Port 1 (a) of adder expects 4 bits, got 8.\n",
                                classify::Phase::Compile);
        if (width.category != FailureCategory::PortMismatch)
        {
            return fail(std::string("port width warning not PortMismatch, got ") + design::toString(width.category));
        }
    }

    // Unrecognized compiler output keeps a bounded tail
    {
        std::string raw(20000, 'x');
        raw.append("THE END");
        const design::Diagnosis d = classifier.classify(raw, classify::Phase::Compile);
        if (d.category != FailureCategory::Unknown)
        {
            return fail("gibberish was classified");
        }
        if (d.evidence.size() != classify::kUnknownEvidenceLimit || d.evidence.find("THE END") == std::string::npos)
        {
            return fail("unknown evidence not tail-capped");
        }
    }

    // Simulation failures
    {
        const design::Diagnosis d = classifier.classify("VLP_PASS a=0 b=0\n"
                                                        "VLP_FAIL a=1 b=1 expected=10 got=00\n"
                                                        "VLP_DONE\n",
                                                        classify::Phase::Simulation);
        if (d.category != FailureCategory::AssertionFailure ||
            d.evidence != "VLP_FAIL a=1 b=1 expected=10 got=00")
        {
            return fail("failing vector not isolated: " + d.evidence);
        }

        std::string many;
        for (int i = 0; i < 12; ++i)
        {
            many.append("VLP_FAIL vector " + std::to_string(i) + "\n");
        }
        const design::Diagnosis capped = classifier.classify(many, classify::Phase::Simulation);
        if (capped.evidence.find("vector 7") == std::string::npos ||
            capped.evidence.find("vector 8") != std::string::npos ||
            capped.evidence.find("(4 more failing vectors)") == std::string::npos)
        {
            return fail("failing vectors not capped: " + capped.evidence);
        }

        const design::Diagnosis silent = classifier.classify("nothing useful\n", classify::Phase::Simulation);
        if (silent.category != FailureCategory::Unknown)
        {
            return fail("simulation output without failures was classified");
        }
    }

    // Outcomes
    {
        const auto timeout = classifier.classify(design::VerificationOutcome::makeTimeout("no VLP_DONE"));
        if (timeout.category != FailureCategory::Timeout)
        {
            return fail("timeout outcome not classified as Timeout");
        }
        const auto logic = classifier.classify(
            design::VerificationOutcome::makeLogicError("full log", {"VLP_FAIL x expected=1 got=0"}));
        if (logic.category != FailureCategory::AssertionFailure || logic.evidence != "VLP_FAIL x expected=1 got=0")
        {
            return fail("logic outcome evidence wrong");
        }
        const auto tool = classifier.classify(design::VerificationOutcome::makeToolUnavailable("no iverilog"));
        if (tool.category != FailureCategory::Unknown)
        {
            return fail("tool failure classified");
        }
    }

    // Custom markers
    {
        design::MarkerSet markers;
        markers.fail = "MISMATCH";
        const classify::DiagnosticClassifier custom(markers);
        const auto d = custom.classify("MISMATCH y expected=1 got=0\n", classify::Phase::Simulation);
        if (d.category != FailureCategory::AssertionFailure)
        {
            return fail("custom fail marker ignored");
        }
    }

    return 0;
}
