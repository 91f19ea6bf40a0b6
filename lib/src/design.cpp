#include "design.hpp"

#include <cctype>
#include <functional>
#include <stdexcept>
#include <unordered_set>

namespace veriloop::lib::design
{

    const char *toString(PortDirection direction) noexcept
    {
        switch (direction)
        {
        case PortDirection::Input:
            return "input";
        case PortDirection::Output:
            return "output";
        case PortDirection::Inout:
        default:
            return "inout";
        }
    }

    std::optional<PortDirection> parsePortDirection(std::string_view text)
    {
        std::string lowered(text);
        for (char &c : lowered)
        {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (lowered == "input" || lowered == "in")
        {
            return PortDirection::Input;
        }
        if (lowered == "output" || lowered == "out")
        {
            return PortDirection::Output;
        }
        if (lowered == "inout")
        {
            return PortDirection::Inout;
        }
        return std::nullopt;
    }

    std::string formatPort(const Port &port)
    {
        std::string text = toString(port.direction);
        if (port.width > 1)
        {
            text.append(" [");
            text.append(std::to_string(port.width - 1));
            text.append(":0]");
        }
        text.push_back(' ');
        text.append(port.name);
        return text;
    }

    std::string formatPortList(const std::vector<Port> &ports)
    {
        std::string text;
        for (const Port &port : ports)
        {
            if (!text.empty())
            {
                text.append(", ");
            }
            text.append(formatPort(port));
        }
        return text.empty() ? std::string("(no ports)") : text;
    }

    bool isIdentifier(std::string_view text) noexcept
    {
        if (text.empty())
        {
            return false;
        }
        const auto first = static_cast<unsigned char>(text.front());
        if (!std::isalpha(first) && first != '_')
        {
            return false;
        }
        for (char ch : text.substr(1))
        {
            const auto c = static_cast<unsigned char>(ch);
            if (!std::isalnum(c) && c != '_' && c != '$')
            {
                return false;
            }
        }
        return true;
    }

    const char *toString(OutcomeKind kind) noexcept
    {
        switch (kind)
        {
        case OutcomeKind::Passed:
            return "Passed";
        case OutcomeKind::CompileError:
            return "CompileError";
        case OutcomeKind::LogicError:
            return "LogicError";
        case OutcomeKind::Timeout:
            return "Timeout";
        case OutcomeKind::ToolUnavailable:
        default:
            return "ToolUnavailable";
        }
    }

    VerificationOutcome VerificationOutcome::makePassed(std::string log, std::optional<std::vector<Port>> interface)
    {
        VerificationOutcome outcome;
        outcome.kind = OutcomeKind::Passed;
        outcome.diagnostic = std::move(log);
        outcome.interface = std::move(interface);
        return outcome;
    }

    VerificationOutcome VerificationOutcome::makeCompileError(std::string diagnostic)
    {
        VerificationOutcome outcome;
        outcome.kind = OutcomeKind::CompileError;
        outcome.diagnostic = std::move(diagnostic);
        return outcome;
    }

    VerificationOutcome VerificationOutcome::makeLogicError(std::string diagnostic, std::vector<std::string> failingVectors)
    {
        VerificationOutcome outcome;
        outcome.kind = OutcomeKind::LogicError;
        outcome.diagnostic = std::move(diagnostic);
        outcome.failingVectors = std::move(failingVectors);
        return outcome;
    }

    VerificationOutcome VerificationOutcome::makeTimeout(std::string diagnostic)
    {
        VerificationOutcome outcome;
        outcome.kind = OutcomeKind::Timeout;
        outcome.diagnostic = std::move(diagnostic);
        return outcome;
    }

    VerificationOutcome VerificationOutcome::makeToolUnavailable(std::string reason)
    {
        VerificationOutcome outcome;
        outcome.kind = OutcomeKind::ToolUnavailable;
        outcome.diagnostic = std::move(reason);
        return outcome;
    }

    const char *toString(FailureCategory category) noexcept
    {
        switch (category)
        {
        case FailureCategory::SyntaxError:
            return "SyntaxError";
        case FailureCategory::UnresolvedReference:
            return "UnresolvedReference";
        case FailureCategory::PortMismatch:
            return "PortMismatch";
        case FailureCategory::AssertionFailure:
            return "AssertionFailure";
        case FailureCategory::Timeout:
            return "Timeout";
        case FailureCategory::Unknown:
        default:
            return "Unknown";
        }
    }

    const char *toString(ModuleStatus status) noexcept
    {
        switch (status)
        {
        case ModuleStatus::Verified:
            return "Verified";
        case ModuleStatus::Exhausted:
            return "Exhausted";
        case ModuleStatus::Aborted:
            return "Aborted";
        case ModuleStatus::Skipped:
        default:
            return "Skipped";
        }
    }

    const char *toString(DesignStatus status) noexcept
    {
        switch (status)
        {
        case DesignStatus::Verified:
            return "Verified";
        case DesignStatus::PartiallyFailed:
            return "PartiallyFailed";
        case DesignStatus::Aborted:
        default:
            return "Aborted";
        }
    }

    const ModuleResult *DesignResult::find(std::string_view node) const
    {
        for (const ModuleResult &module : modules)
        {
            if (module.node == node)
            {
                return &module;
            }
        }
        return nullptr;
    }

    bool ModuleContext::add(VerifiedModule module)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string key = module.name;
        return entries_.emplace(std::move(key), std::move(module)).second;
    }

    std::optional<VerifiedModule> ModuleContext::find(std::string_view name) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    bool ModuleContext::contains(std::string_view name) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.find(name) != entries_.end();
    }

    std::size_t ModuleContext::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::vector<std::string> ModuleContext::names() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto &[name, module] : entries_)
        {
            result.push_back(name);
        }
        return result;
    }

    ContextSnapshot ModuleContext::snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    std::vector<const VerifiedModule *> dependencyClosure(const PlanNode &node, const ContextSnapshot &snapshot)
    {
        std::vector<const VerifiedModule *> ordered;
        std::unordered_set<std::string> visited;

        std::function<void(const std::string &)> visit = [&](const std::string &name) {
            if (!visited.insert(name).second)
            {
                return;
            }
            auto it = snapshot.find(name);
            if (it == snapshot.end())
            {
                throw std::logic_error("dependency '" + name + "' of '" + node.name + "' is not verified");
            }
            for (const std::string &dep : it->second.dependencies)
            {
                visit(dep);
            }
            ordered.push_back(&it->second);
        };

        for (const std::string &dep : node.dependencies)
        {
            visit(dep);
        }
        return ordered;
    }

} // namespace veriloop::lib::design
