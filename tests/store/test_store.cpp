#include "json.hpp"
#include "store.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#ifndef VERILOOP_TEST_ARTIFACT_DIR
#error "VERILOOP_TEST_ARTIFACT_DIR must be defined"
#endif

using namespace veriloop::lib;

namespace
{

    int fail(const std::string &message)
    {
        std::cerr << "[store-tests] " << message << '\n';
        return 1;
    }

    std::string slurp(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    design::ModuleResult verifiedModule(const std::string &name, std::vector<std::string> deps)
    {
        design::ModuleResult module;
        module.node = name;
        module.status = design::ModuleStatus::Verified;
        design::Attempt attempt;
        attempt.index = 1;
        attempt.implementation = "module " + name + "; endmodule";
        attempt.harness = "module tb_" + name + "; endmodule";
        attempt.outcome = design::VerificationOutcome::makePassed("VLP_PASS v0\nVLP_DONE\n");
        module.attempts.push_back(attempt);
        module.verified = design::VerifiedModule{name, attempt.implementation, attempt.harness,
                                                 {{"a", 1, design::PortDirection::Input}}, std::move(deps)};
        return module;
    }

    design::DesignResult verifiedDesign()
    {
        design::DesignResult result;
        result.status = design::DesignStatus::Verified;
        result.top = "full_adder";
        result.modules.push_back(verifiedModule("half_adder", {}));
        result.modules.push_back(verifiedModule("full_adder", {"half_adder"}));
        result.integratedDesign = "module half_adder; endmodule\n\nmodule full_adder; endmodule\n";
        return result;
    }

    design::DesignResult failedDesign()
    {
        design::DesignResult result;
        result.status = design::DesignStatus::PartiallyFailed;
        result.top = "top";
        design::ModuleResult leaf;
        leaf.node = "leaf";
        leaf.status = design::ModuleStatus::Exhausted;
        leaf.lastDiagnostic = "SyntaxError: leaf.v:3: syntax error";
        design::Attempt attempt;
        attempt.index = 1;
        attempt.implementation = "module leaf;";
        attempt.outcome = design::VerificationOutcome::makeCompileError("leaf.v:3: syntax error\n");
        attempt.diagnosis = design::Diagnosis{design::FailureCategory::SyntaxError, "leaf.v:3: syntax error",
                                              "leaf.v", 3, false};
        leaf.attempts.push_back(attempt);
        design::ModuleResult top;
        top.node = "top";
        top.status = design::ModuleStatus::Skipped;
        top.reason = "dependency 'leaf' did not verify";
        result.modules = {leaf, top};
        result.failedNodes = {"leaf"};
        result.skippedNodes = {"top"};
        result.reason = "failed: leaf; skipped: top";
        return result;
    }

} // namespace

int main()
{
    const std::filesystem::path root = std::filesystem::path(VERILOOP_TEST_ARTIFACT_DIR) / "store";
    std::filesystem::remove_all(root);

    // Verified design layout
    {
        store::StoreDiagnostics diags("store");
        store::DesignStore designStore(&diags);
        store::StoreOptions options;
        options.outputDir = root.string();
        options.timestamp = "20260101_120000";
        const store::StoreResult stored = designStore.store(verifiedDesign(), options);
        if (!stored.success || diags.hasError())
        {
            return fail("verified design not stored");
        }
        const std::filesystem::path dir = root / "20260101_120000_full_adder";
        for (const char *file : {"design.v", "testbench.v", "half_adder.v", "tb_half_adder.v", "full_adder.v",
                                 "tb_full_adder.v"})
        {
            if (!std::filesystem::exists(dir / file))
            {
                return fail(std::string("missing stored file ") + file);
            }
        }
        if (slurp(dir / "design.v") != verifiedDesign().integratedDesign ||
            slurp(dir / "testbench.v") != "module tb_full_adder; endmodule\n")
        {
            return fail("stored contents differ");
        }
        if (stored.artifacts.size() != 6)
        {
            return fail("artifact list incomplete");
        }

        const store::StoreResult again = designStore.store(verifiedDesign(), options);
        if (!again.success || !std::filesystem::exists(root / "20260101_120000_full_adder_2" / "design.v"))
        {
            return fail("second store overwrote the first");
        }
    }

    // Only verified designs are stored
    {
        store::StoreDiagnostics diags("store");
        store::DesignStore designStore(&diags);
        store::StoreOptions options;
        options.outputDir = (root / "rejected").string();
        const store::StoreResult stored = designStore.store(failedDesign(), options);
        if (stored.success || !diags.hasError() || std::filesystem::exists(root / "rejected"))
        {
            return fail("partially failed design was stored");
        }
    }

    // Report JSON carries every attempt
    {
        store::StoreDiagnostics diags("store");
        store::ReportStore reportStore(&diags);
        store::StoreOptions options;
        options.outputDir = root.string();
        options.outputFilename = "report.json";
        const store::StoreResult stored = reportStore.store(failedDesign(), options);
        if (!stored.success || stored.artifacts.size() != 1)
        {
            return fail("report not written");
        }
        const json::JsonValue report = json::parse(slurp(root / "report.json"));
        if (report.find("status")->asString("status") != "PartiallyFailed" || report.find("integratedDesign"))
        {
            return fail("report status wrong");
        }
        const auto &modules = report.find("modules")->asArray("modules");
        if (modules.size() != 2 || modules[1].find("status")->asString("status") != "Skipped")
        {
            return fail("report modules wrong");
        }
        const auto &attempts = modules[0].find("attempts")->asArray("attempts");
        if (attempts.size() != 1 ||
            attempts[0].find("diagnosis")->find("category")->asString("category") != "SyntaxError" ||
            attempts[0].find("diagnosis")->find("line")->asInt("line") != 3)
        {
            return fail("attempt diagnosis missing from the report");
        }

        store::StoreOptions compact;
        compact.jsonMode = store::JsonPrintMode::Compact;
        const auto text = reportStore.storeToString(verifiedDesign(), compact);
        if (!text || text->find('\n') != std::string::npos ||
            json::parse(*text).find("integratedDesign") == nullptr)
        {
            return fail("compact report wrong");
        }
    }

    // Diffs between attempts
    {
        if (!store::unifiedDiff("a\nb\n", "a\nb\n").empty())
        {
            return fail("identical texts produced a diff");
        }
        const std::string diff = store::unifiedDiff("a\nb\nc\n", "a\nx\nc\n");
        if (diff.rfind("--- previous\n+++ current\n", 0) != 0 || diff.find("@@ -1,3 +1,3 @@") == std::string::npos ||
            diff.find("\n-b\n") == std::string::npos || diff.find("\n+x\n") == std::string::npos ||
            diff.find("\n a\n") == std::string::npos)
        {
            return fail("unexpected diff:\n" + diff);
        }
    }

    // A rewrite too large for the line table becomes one replacement hunk
    {
        std::string before = "module big;\n";
        std::string after = "module big;\n";
        for (int i = 0; i < 3000; ++i)
        {
            before.append("  wire old_" + std::to_string(i) + ";\n");
            after.append("  wire new_" + std::to_string(i) + ";\n");
        }
        before.append("endmodule\n");
        after.append("endmodule\n");
        const std::string diff = store::unifiedDiff(before, after);
        if (diff.find("@@ -1,3002 +1,3002 @@") == std::string::npos ||
            diff.find("\n module big;\n-  wire old_0;\n") == std::string::npos ||
            diff.find("\n+  wire new_2999;\n endmodule\n") == std::string::npos)
        {
            return fail("large rewrite not emitted as a single replacement");
        }
    }

    // Directory names
    {
        if (store::safeName("4-bit Ripple Carry Adder!") != "4_bit_ripple_carry_adder" ||
            store::safeName("???") != "design" || store::safeName(std::string(80, 'a')).size() != 40)
        {
            return fail("safeName output wrong");
        }
        if (store::currentTimestamp().size() != 15)
        {
            return fail("timestamp format wrong");
        }
    }

    return 0;
}
