#include "prompts.hpp"

namespace veriloop::lib::gen
{

    namespace
    {

        const char *kSystemPrompt =
            "You are acting as an expert Computer Hardware Engineer specializing in Verilog "
            "(hardware description language). Your goal is to write synthesizable Verilog-2001 code. "
            "Follow these explicit rules:\n"
            "1. Use `module` and `endmodule` explicitly.\n"
            "2. Use `parameter` for configurable widths.\n"
            "3. Use synchronous active-high reset unless specified otherwise.\n"
            "4. Always use non-blocking assignments (`<=`) in sequential logic and blocking (`=`) in "
            "combinational logic.\n"
            "5. Output ONLY the code when requested. All code must be contained within a single "
            "```verilog code block, not multiple code blocks or files.\n"
            "6. Never use SystemVerilog constructs, including declaring variables inside initial blocks.";

        void appendNodeHeader(std::string &out, const design::PlanNode &node)
        {
            out.append("Module name: ");
            out.append(node.name);
            out.append("\nPorts: ");
            out.append(node.ports.empty() ? std::string("not fixed; choose a clear, minimal port list")
                                          : design::formatPortList(node.ports));
            out.append("\nBehavior: ");
            out.append(node.description);
            out.push_back('\n');
        }

        void appendDependencies(std::string &out, const std::vector<const design::VerifiedModule *> &dependencies)
        {
            if (dependencies.empty())
            {
                return;
            }
            out.append("\nThe following submodules are already verified and will be compiled together with "
                       "your code. Instantiate them as needed using exactly these interfaces; do NOT "
                       "redefine them:\n");
            for (const design::VerifiedModule *dep : dependencies)
            {
                out.append("- ");
                out.append(dep->name);
                out.append(" (");
                out.append(design::formatPortList(dep->interface));
                out.append(")\n");
            }
        }

        void appendEvidence(std::string &out, const design::Diagnosis &diagnosis)
        {
            out.append("--- Failure (");
            out.append(design::toString(diagnosis.category));
            out.append(") ---\n");
            out.append(diagnosis.evidence);
            if (!diagnosis.evidence.empty() && diagnosis.evidence.back() != '\n')
            {
                out.push_back('\n');
            }
        }

    } // namespace

    PromptBuilder::PromptBuilder(std::string extraInstructions, design::MarkerSet markers)
        : system_(kSystemPrompt), markers_(std::move(markers))
    {
        if (!extraInstructions.empty())
        {
            system_.append("\n\nADDITIONAL INSTRUCTIONS:\n");
            system_.append(extraInstructions);
        }
    }

    Prompt PromptBuilder::decomposition(const design::DesignRequest &request) const
    {
        std::string user =
            "Decompose the following hardware requirement into a hierarchy of Verilog modules.\n"
            "Requirement: ";
        user.append(request.prompt);
        user.push_back('\n');
        if (!request.interfaceHints.empty())
        {
            user.append("The top-level module must expose exactly these ports: ");
            user.append(design::formatPortList(request.interfaceHints));
            user.push_back('\n');
        }
        user.append(
            "Answer with a single JSON object and nothing else, using this schema:\n"
            "{\"modules\": [{\"name\": \"<verilog identifier>\", \"description\": \"<behavior>\",\n"
            "  \"ports\": [{\"name\": \"<identifier>\", \"direction\": \"input|output|inout\", \"width\": <bits>}],\n"
            "  \"dependencies\": [\"<names of modules this one instantiates>\"]}]}\n"
            "Rules: every module name is unique; dependencies only name modules in the list; there are "
            "no cycles; exactly one module (the top) is not used by any other module. Keep modules small "
            "enough to be tested on their own. A simple requirement may be a single module.");
        return Prompt{"decompose", system_, std::move(user)};
    }

    Prompt PromptBuilder::implementation(const design::PlanNode &node,
                                         const std::vector<const design::VerifiedModule *> &dependencies) const
    {
        std::string user = "Write a Verilog module for the following requirement.\n";
        appendNodeHeader(user, node);
        user.append("The module must be named exactly `");
        user.append(node.name);
        user.append(node.ports.empty() ? "`.\n" : "` and declare exactly the ports listed above.\n");
        appendDependencies(user, dependencies);
        return Prompt{"implement " + node.name, system_, std::move(user)};
    }

    Prompt PromptBuilder::harness(const design::PlanNode &node, std::string_view implementation) const
    {
        std::string user = "Write a self-checking Verilog testbench for the following module.\n";
        appendNodeHeader(user, node);
        user.append("1. Name the testbench module `tb_");
        user.append(node.name);
        user.append("` and instantiate the unit under test.\n"
                    "2. Generate a clock if the design is sequential.\n"
                    "3. Apply test vectors covering corner cases.\n"
                    "4. After checking each vector, print exactly one line with $display: `");
        user.append(markers_.pass);
        user.append(" <vector>` when it matches or `");
        user.append(markers_.fail);
        user.append(" <vector> expected=<value> got=<value>` when it does not.\n"
                    "5. After the last vector print `");
        user.append(markers_.done);
        user.append("` and then call $finish.\n"
                    "6. DO NOT include the design module code in your response. Only the testbench.\n"
                    "--- Design Under Test ---\n");
        user.append(implementation);
        user.push_back('\n');
        return Prompt{"harness " + node.name, system_, std::move(user)};
    }

    Prompt PromptBuilder::repairImplementation(const design::PlanNode &node, const RepairContext &repair,
                                               const std::vector<const design::VerifiedModule *> &dependencies) const
    {
        std::string user = "The following Verilog module failed verification (attempt ";
        user.append(std::to_string(repair.failedAttempt));
        user.append("). Fix the module. Return ONLY the full corrected module.\n");
        appendNodeHeader(user, node);
        appendDependencies(user, dependencies);
        appendEvidence(user, repair.diagnosis);
        user.append("\n--- Original Code ---\n");
        user.append(repair.previousImplementation);
        user.push_back('\n');
        return Prompt{"repair " + node.name, system_, std::move(user)};
    }

    Prompt PromptBuilder::repairHarness(const design::PlanNode &node, const RepairContext &repair) const
    {
        std::string user = "The following Verilog testbench for module `";
        user.append(node.name);
        user.append("` is itself broken (attempt ");
        user.append(std::to_string(repair.failedAttempt));
        user.append("). Fix the testbench, not the design. DO NOT include the design module code. "
                    "Output ONLY the testbench module.\n"
                    "Keep the reporting protocol: `");
        user.append(markers_.pass);
        user.append("` or `");
        user.append(markers_.fail);
        user.append("` per vector, then `");
        user.append(markers_.done);
        user.append("` followed by $finish.\n");
        appendEvidence(user, repair.diagnosis);
        user.append("\n--- Design Under Test ---\n");
        user.append(repair.previousImplementation);
        user.append("\n--- Original Testbench ---\n");
        user.append(repair.previousHarness);
        user.push_back('\n');
        return Prompt{"repair-harness " + node.name, system_, std::move(user)};
    }

} // namespace veriloop::lib::gen
