#ifndef VERILOOP_DESIGN_HPP
#define VERILOOP_DESIGN_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace veriloop::lib::design
{

    enum class PortDirection
    {
        Input,
        Output,
        Inout
    };

    const char *toString(PortDirection direction) noexcept;
    std::optional<PortDirection> parsePortDirection(std::string_view text);

    struct Port
    {
        std::string name;
        int64_t width = 1;
        PortDirection direction = PortDirection::Input;

        bool operator==(const Port &other) const = default;
    };

    // "input [3:0] a" style rendering used in prompts and mismatch messages.
    std::string formatPort(const Port &port);
    std::string formatPortList(const std::vector<Port> &ports);

    bool isIdentifier(std::string_view text) noexcept;

    struct DesignRequest
    {
        std::string prompt;
        std::vector<Port> interfaceHints;
        std::string name;
    };

    struct PlanNode
    {
        std::string name;
        std::vector<Port> ports;
        std::string description;
        std::vector<std::string> dependencies;
    };

    // Lines a generated harness prints: one pass or fail line per vector, then the done line.
    struct MarkerSet
    {
        std::string pass = "VLP_PASS";
        std::string fail = "VLP_FAIL";
        std::string done = "VLP_DONE";
    };

    enum class OutcomeKind
    {
        Passed,
        CompileError,
        LogicError,
        Timeout,
        ToolUnavailable
    };

    const char *toString(OutcomeKind kind) noexcept;

    struct VerificationOutcome
    {
        OutcomeKind kind = OutcomeKind::ToolUnavailable;
        // Raw tool output (or the failure reason for Timeout/ToolUnavailable).
        std::string diagnostic;
        // Failing-vector lines reported by the harness (LogicError only).
        std::vector<std::string> failingVectors;
        // Port list read back from the implementation (Passed only, when available).
        std::optional<std::vector<Port>> interface;

        bool passed() const noexcept { return kind == OutcomeKind::Passed; }

        static VerificationOutcome makePassed(std::string log, std::optional<std::vector<Port>> interface = std::nullopt);
        static VerificationOutcome makeCompileError(std::string diagnostic);
        static VerificationOutcome makeLogicError(std::string diagnostic, std::vector<std::string> failingVectors);
        static VerificationOutcome makeTimeout(std::string diagnostic);
        static VerificationOutcome makeToolUnavailable(std::string reason);
    };

    enum class FailureCategory
    {
        SyntaxError,
        UnresolvedReference,
        PortMismatch,
        AssertionFailure,
        Timeout,
        Unknown
    };

    const char *toString(FailureCategory category) noexcept;

    struct Diagnosis
    {
        FailureCategory category = FailureCategory::Unknown;
        std::string evidence;
        std::string file;
        int64_t line = 0;
        // The first error points into the test harness rather than the design.
        bool harnessImplicated = false;
    };

    struct Attempt
    {
        uint32_t index = 0;
        std::string implementation;
        std::string harness;
        VerificationOutcome outcome;
        std::optional<Diagnosis> diagnosis;
    };

    struct VerifiedModule
    {
        std::string name;
        std::string implementation;
        std::string harness;
        std::vector<Port> interface;
        std::vector<std::string> dependencies;
    };

    enum class ModuleStatus
    {
        Verified,
        Exhausted,
        Aborted,
        Skipped
    };

    const char *toString(ModuleStatus status) noexcept;

    struct ModuleResult
    {
        std::string node;
        ModuleStatus status = ModuleStatus::Aborted;
        // Verified only.
        std::optional<VerifiedModule> verified;
        // Exhausted: last diagnostic evidence (or raw output when unclassified).
        std::string lastDiagnostic;
        // Aborted / Skipped.
        std::string reason;
        std::vector<Attempt> attempts;

        uint32_t attemptCount() const noexcept { return static_cast<uint32_t>(attempts.size()); }
    };

    enum class DesignStatus
    {
        Verified,
        PartiallyFailed,
        Aborted
    };

    const char *toString(DesignStatus status) noexcept;

    struct DesignResult
    {
        DesignStatus status = DesignStatus::Aborted;
        std::string top;
        // One entry per plan node in topological order (empty when planning failed).
        std::vector<ModuleResult> modules;
        // Verified only.
        std::string integratedDesign;
        // PartiallyFailed: nodes that reached Exhausted or Aborted, then nodes skipped because of them.
        std::vector<std::string> failedNodes;
        std::vector<std::string> skippedNodes;
        std::string reason;

        const ModuleResult *find(std::string_view node) const;
    };

    using ContextSnapshot = std::map<std::string, VerifiedModule, std::less<>>;

    class ModuleContext
    {
    public:
        ModuleContext() = default;
        ModuleContext(const ModuleContext &) = delete;
        ModuleContext &operator=(const ModuleContext &) = delete;

        // Adds a verified module; returns false (and leaves the context untouched) when the
        // name is already present.
        bool add(VerifiedModule module);

        std::optional<VerifiedModule> find(std::string_view name) const;
        bool contains(std::string_view name) const;
        std::size_t size() const;
        std::vector<std::string> names() const;

        // Copy of every entry verified so far, taken atomically with respect to add().
        ContextSnapshot snapshot() const;

    private:
        ContextSnapshot entries_;
        mutable std::mutex mutex_;
    };

    // Dependencies of `node`, transitively, ordered dependency-first; every name must be in
    // the snapshot.
    std::vector<const VerifiedModule *> dependencyClosure(const PlanNode &node, const ContextSnapshot &snapshot);

} // namespace veriloop::lib::design

#endif // VERILOOP_DESIGN_HPP
