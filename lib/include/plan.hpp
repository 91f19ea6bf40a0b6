#ifndef VERILOOP_PLAN_HPP
#define VERILOOP_PLAN_HPP

#include "design.hpp"
#include "diagnostics.hpp"
#include "generation.hpp"
#include "logging.hpp"
#include "prompts.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace veriloop::lib::plan
{

    enum class PlanningErrorKind
    {
        CyclicDependency,
        AmbiguousTop,
        UnparsableDecomposition
    };

    const char *toString(PlanningErrorKind kind) noexcept;

    class PlanningError : public std::runtime_error
    {
    public:
        PlanningError(PlanningErrorKind kind, const std::string &message)
            : std::runtime_error(message), kind_(kind)
        {
        }

        PlanningErrorKind kind() const noexcept { return kind_; }

    private:
        PlanningErrorKind kind_;
    };

    // Validated, immutable dependency graph. Nodes are stored in topological order
    // (dependencies first, ties by declaration order), so the top module is always last.
    class DesignPlan
    {
    public:
        const std::vector<design::PlanNode> &nodes() const noexcept { return nodes_; }
        const design::PlanNode &top() const { return nodes_.back(); }
        std::size_t size() const noexcept { return nodes_.size(); }

        const design::PlanNode *find(std::string_view name) const;
        std::size_t indexOf(std::string_view name) const;

        // Nodes that list `name` as a dependency, directly or through other nodes, in plan order.
        std::vector<std::string> transitiveDependents(std::string_view name) const;

    private:
        friend class PlanBuilder;

        explicit DesignPlan(std::vector<design::PlanNode> ordered) : nodes_(std::move(ordered)) {}

        std::vector<design::PlanNode> nodes_;
    };

    class PlanBuilder
    {
    public:
        PlanBuilder(gen::GenerationClient &client, const gen::PromptBuilder &prompts, Logger *logger = nullptr,
                    diag::Diagnostics *diags = nullptr)
            : client_(client), prompts_(prompts), logger_(logger), diags_(diags)
        {
        }

        // Asks the backend for a decomposition and validates it. Throws PlanningError, or
        // GenerationError when the backend call itself fails.
        DesignPlan build(const design::DesignRequest &request);

        // Validates a decomposition document without calling the backend. When the top module
        // declares no ports, `hints` are adopted as its ports (reported to `diags`).
        static DesignPlan parse(std::string_view text, const std::vector<design::Port> &hints = {},
                                diag::Diagnostics *diags = nullptr);

        // Validates already-typed nodes (given in declaration order) and orders them.
        static DesignPlan assemble(std::vector<design::PlanNode> nodes);

        // One-node plan for the non-hierarchical mode: the request prompt becomes the behavior
        // and the interface hints become the ports.
        static DesignPlan singleModule(const design::DesignRequest &request, const std::string &name);

    private:
        gen::GenerationClient &client_;
        const gen::PromptBuilder &prompts_;
        Logger *logger_;
        diag::Diagnostics *diags_;
    };

} // namespace veriloop::lib::plan

#endif // VERILOOP_PLAN_HPP
