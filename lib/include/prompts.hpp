#ifndef VERILOOP_PROMPTS_HPP
#define VERILOOP_PROMPTS_HPP

#include "design.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace veriloop::lib::gen
{

    struct Prompt
    {
        // Short label for logs ("implement full_adder", "repair-harness full_adder", ...).
        std::string purpose;
        std::string system;
        std::string user;
    };

    // Carried from one attempt into the next one's Generating step.
    struct RepairContext
    {
        uint32_t failedAttempt = 0;
        std::string previousImplementation;
        std::string previousHarness;
        design::Diagnosis diagnosis;
    };

    class PromptBuilder
    {
    public:
        explicit PromptBuilder(std::string extraInstructions = {}, design::MarkerSet markers = {});

        const std::string &system() const noexcept { return system_; }
        const design::MarkerSet &markers() const noexcept { return markers_; }

        Prompt decomposition(const design::DesignRequest &request) const;
        Prompt implementation(const design::PlanNode &node,
                              const std::vector<const design::VerifiedModule *> &dependencies) const;
        Prompt harness(const design::PlanNode &node, std::string_view implementation) const;
        Prompt repairImplementation(const design::PlanNode &node, const RepairContext &repair,
                                    const std::vector<const design::VerifiedModule *> &dependencies) const;
        Prompt repairHarness(const design::PlanNode &node, const RepairContext &repair) const;

    private:
        std::string system_;
        design::MarkerSet markers_;
    };

} // namespace veriloop::lib::gen

#endif // VERILOOP_PROMPTS_HPP
