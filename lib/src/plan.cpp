#include "plan.hpp"

#include "json.hpp"

#include <set>
#include <unordered_map>
#include <unordered_set>

namespace veriloop::lib::plan
{

    namespace
    {

        using design::PlanNode;
        using design::Port;
        using json::JsonValue;

        [[noreturn]] void unparsable(const std::string &message)
        {
            throw PlanningError(PlanningErrorKind::UnparsableDecomposition, message);
        }

        std::string joinNames(const std::vector<std::string> &names)
        {
            std::string out;
            for (const std::string &name : names)
            {
                if (!out.empty())
                {
                    out.append(", ");
                }
                out.append(name);
            }
            return out;
        }

        const std::string &requireString(const JsonValue &object, std::string_view key, const std::string &ctx)
        {
            const JsonValue *value = object.find(key);
            if (!value || !value->isString())
            {
                unparsable(ctx + ": missing string field '" + std::string(key) + "'");
            }
            return value->asString(ctx);
        }

        Port parsePort(const JsonValue &value, const std::string &ctx)
        {
            if (!value.isObject())
            {
                unparsable(ctx + ": port must be an object");
            }
            Port port;
            port.name = requireString(value, "name", ctx);
            const std::string &directionText = requireString(value, "direction", ctx + "." + port.name);
            auto direction = design::parsePortDirection(directionText);
            if (!direction)
            {
                unparsable(ctx + "." + port.name + ": unknown direction '" + directionText + "'");
            }
            port.direction = *direction;
            if (const JsonValue *width = value.find("width"))
            {
                if (!width->isInt())
                {
                    unparsable(ctx + "." + port.name + ": width must be an integer");
                }
                port.width = width->asInt(ctx);
            }
            return port;
        }

        PlanNode parseNode(const JsonValue &value, std::size_t index)
        {
            const std::string ctx = "modules[" + std::to_string(index) + "]";
            if (!value.isObject())
            {
                unparsable(ctx + ": module must be an object");
            }
            PlanNode node;
            node.name = requireString(value, "name", ctx);
            if (const JsonValue *description = value.find("description"))
            {
                if (!description->isString())
                {
                    unparsable(ctx + ": description must be a string");
                }
                node.description = description->asString(ctx);
            }
            if (const JsonValue *ports = value.find("ports"))
            {
                if (!ports->isArray())
                {
                    unparsable(ctx + ": ports must be an array");
                }
                for (const JsonValue &port : ports->asArray(ctx))
                {
                    node.ports.push_back(parsePort(port, ctx + "(" + node.name + ")"));
                }
            }
            if (const JsonValue *deps = value.find("dependencies"))
            {
                if (!deps->isArray())
                {
                    unparsable(ctx + ": dependencies must be an array");
                }
                for (const JsonValue &dep : deps->asArray(ctx))
                {
                    if (!dep.isString())
                    {
                        unparsable(ctx + ": dependency names must be strings");
                    }
                    node.dependencies.push_back(dep.asString(ctx));
                }
            }
            return node;
        }

        void checkPorts(const PlanNode &node)
        {
            std::unordered_set<std::string> seen;
            for (const Port &port : node.ports)
            {
                if (!design::isIdentifier(port.name))
                {
                    unparsable("module '" + node.name + "': invalid port name '" + port.name + "'");
                }
                if (!seen.insert(port.name).second)
                {
                    unparsable("module '" + node.name + "': duplicate port '" + port.name + "'");
                }
                if (port.width < 1)
                {
                    unparsable("module '" + node.name + "': port '" + port.name + "' has width " +
                               std::to_string(port.width));
                }
            }
        }

    } // namespace

    const char *toString(PlanningErrorKind kind) noexcept
    {
        switch (kind)
        {
        case PlanningErrorKind::CyclicDependency:
            return "CyclicDependency";
        case PlanningErrorKind::AmbiguousTop:
            return "AmbiguousTop";
        case PlanningErrorKind::UnparsableDecomposition:
        default:
            return "UnparsableDecomposition";
        }
    }

    const design::PlanNode *DesignPlan::find(std::string_view name) const
    {
        for (const PlanNode &node : nodes_)
        {
            if (node.name == name)
            {
                return &node;
            }
        }
        return nullptr;
    }

    std::size_t DesignPlan::indexOf(std::string_view name) const
    {
        for (std::size_t i = 0; i < nodes_.size(); ++i)
        {
            if (nodes_[i].name == name)
            {
                return i;
            }
        }
        return nodes_.size();
    }

    std::vector<std::string> DesignPlan::transitiveDependents(std::string_view name) const
    {
        std::unordered_set<std::string> marked;
        marked.insert(std::string(name));
        std::vector<std::string> result;
        // Dependencies always precede their dependents, so one forward pass is enough.
        for (const PlanNode &node : nodes_)
        {
            for (const std::string &dep : node.dependencies)
            {
                if (marked.count(dep) != 0)
                {
                    marked.insert(node.name);
                    result.push_back(node.name);
                    break;
                }
            }
        }
        return result;
    }

    DesignPlan PlanBuilder::build(const design::DesignRequest &request)
    {
        const gen::Prompt prompt = prompts_.decomposition(request);
        logTo(logger_, LogLevel::Info, "plan", "requesting decomposition");
        const std::string reply = client_.generate(prompt);
        logTo(logger_, LogLevel::Trace, "plan", "decomposition reply:\n" + reply);

        DesignPlan plan = parse(reply, request.interfaceHints, diags_);
        std::string order;
        for (const PlanNode &node : plan.nodes())
        {
            if (!order.empty())
            {
                order.append(" -> ");
            }
            order.append(node.name);
        }
        logTo(logger_, LogLevel::Info, "plan",
              std::to_string(plan.size()) + " module(s), top '" + plan.top().name + "': " + order);
        return plan;
    }

    DesignPlan PlanBuilder::parse(std::string_view text, const std::vector<design::Port> &hints,
                                  diag::Diagnostics *diags)
    {
        const auto located = json::locateDocument(text);
        if (!located)
        {
            unparsable("decomposition contains no JSON document");
        }

        JsonValue root;
        try
        {
            root = json::parse(*located);
        }
        catch (const json::JsonError &ex)
        {
            unparsable(std::string("decomposition is not valid JSON: ") + ex.what());
        }

        const JsonValue *modules = root.isArray() ? &root : root.find("modules");
        if (!modules || !modules->isArray())
        {
            unparsable("decomposition has no 'modules' array");
        }

        std::vector<PlanNode> nodes;
        const auto &items = modules->asArray("modules");
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            nodes.push_back(parseNode(items[i], i));
        }

        DesignPlan plan = assemble(std::move(nodes));
        PlanNode &top = plan.nodes_.back();
        if (top.ports.empty() && !hints.empty())
        {
            top.ports = hints;
            if (diags)
            {
                diags->warning("top module declared no ports; adopted the request's interface hints",
                               design::formatPortList(hints), top.name);
            }
        }
        return plan;
    }

    DesignPlan PlanBuilder::assemble(std::vector<design::PlanNode> nodes)
    {
        if (nodes.empty())
        {
            unparsable("decomposition contains no modules");
        }

        std::unordered_map<std::string, std::size_t> indexByName;
        for (std::size_t i = 0; i < nodes.size(); ++i)
        {
            PlanNode &node = nodes[i];
            if (!design::isIdentifier(node.name))
            {
                unparsable("invalid module name '" + node.name + "'");
            }
            if (!indexByName.emplace(node.name, i).second)
            {
                unparsable("duplicate module name '" + node.name + "'");
            }
            checkPorts(node);

            std::vector<std::string> unique;
            std::unordered_set<std::string> seen;
            for (std::string &dep : node.dependencies)
            {
                if (seen.insert(dep).second)
                {
                    unique.push_back(std::move(dep));
                }
            }
            node.dependencies = std::move(unique);
        }

        for (const PlanNode &node : nodes)
        {
            for (const std::string &dep : node.dependencies)
            {
                if (indexByName.find(dep) == indexByName.end())
                {
                    unparsable("module '" + node.name + "' depends on unknown module '" + dep + "'");
                }
            }
        }
        for (const PlanNode &node : nodes)
        {
            for (const std::string &dep : node.dependencies)
            {
                if (dep == node.name)
                {
                    throw PlanningError(PlanningErrorKind::CyclicDependency,
                                        "module '" + node.name + "' depends on itself");
                }
            }
        }

        // Kahn's algorithm; the ready set is ordered by declaration index.
        std::vector<std::size_t> pending(nodes.size(), 0);
        std::vector<std::vector<std::size_t>> dependents(nodes.size());
        for (std::size_t i = 0; i < nodes.size(); ++i)
        {
            pending[i] = nodes[i].dependencies.size();
            for (const std::string &dep : nodes[i].dependencies)
            {
                dependents[indexByName.at(dep)].push_back(i);
            }
        }
        std::set<std::size_t> ready;
        for (std::size_t i = 0; i < nodes.size(); ++i)
        {
            if (pending[i] == 0)
            {
                ready.insert(i);
            }
        }
        std::vector<std::size_t> order;
        order.reserve(nodes.size());
        while (!ready.empty())
        {
            const std::size_t current = *ready.begin();
            ready.erase(ready.begin());
            order.push_back(current);
            for (std::size_t dependent : dependents[current])
            {
                if (--pending[dependent] == 0)
                {
                    ready.insert(dependent);
                }
            }
        }
        if (order.size() != nodes.size())
        {
            std::vector<std::string> stuck;
            for (std::size_t i = 0; i < nodes.size(); ++i)
            {
                if (pending[i] != 0)
                {
                    stuck.push_back(nodes[i].name);
                }
            }
            throw PlanningError(PlanningErrorKind::CyclicDependency,
                                "dependency cycle among modules: " + joinNames(stuck));
        }

        std::vector<std::string> sinks;
        for (std::size_t i = 0; i < nodes.size(); ++i)
        {
            if (dependents[i].empty())
            {
                sinks.push_back(nodes[i].name);
            }
        }
        if (sinks.size() != 1)
        {
            throw PlanningError(PlanningErrorKind::AmbiguousTop,
                                "expected exactly one top module, found " + std::to_string(sinks.size()) + ": " +
                                    joinNames(sinks));
        }

        std::vector<PlanNode> ordered;
        ordered.reserve(nodes.size());
        for (std::size_t index : order)
        {
            ordered.push_back(std::move(nodes[index]));
        }
        return DesignPlan(std::move(ordered));
    }

    DesignPlan PlanBuilder::singleModule(const design::DesignRequest &request, const std::string &name)
    {
        PlanNode node;
        node.name = name;
        node.ports = request.interfaceHints;
        node.description = request.prompt;
        std::vector<PlanNode> nodes;
        nodes.push_back(std::move(node));
        return assemble(std::move(nodes));
    }

} // namespace veriloop::lib::plan
