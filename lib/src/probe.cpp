#include "probe.hpp"

#include "slang/ast/Compilation.h"
#include "slang/ast/symbols/CompilationUnitSymbols.h"
#include "slang/ast/symbols/InstanceSymbols.h"
#include "slang/ast/symbols/PortSymbols.h"
#include "slang/ast/types/Type.h"
#include "slang/driver/Driver.h"

namespace veriloop::lib::probe
{

    namespace
    {

        std::optional<design::PortDirection> mapDirection(slang::ast::ArgumentDirection direction)
        {
            switch (direction)
            {
            case slang::ast::ArgumentDirection::In:
                return design::PortDirection::Input;
            case slang::ast::ArgumentDirection::Out:
                return design::PortDirection::Output;
            case slang::ast::ArgumentDirection::InOut:
                return design::PortDirection::Inout;
            default:
                return std::nullopt;
            }
        }

        const design::Port *findPort(const std::vector<design::Port> &ports, std::string_view name)
        {
            for (const design::Port &port : ports)
            {
                if (port.name == name)
                {
                    return &port;
                }
            }
            return nullptr;
        }

    } // namespace

    InterfaceReadResult readInterface(std::string_view top, const std::vector<std::filesystem::path> &files)
    {
        InterfaceReadResult result;

        slang::driver::Driver driver;
        driver.addStandardArgs();
        driver.options.topModules.emplace_back(top);

        std::vector<std::string> argStorage;
        argStorage.emplace_back("veriloop-probe");
        for (const std::filesystem::path &file : files)
        {
            argStorage.emplace_back(file.string());
        }
        std::vector<const char *> argv;
        argv.reserve(argStorage.size());
        for (const std::string &arg : argStorage)
        {
            argv.push_back(arg.c_str());
        }

        if (!driver.parseCommandLine(static_cast<int>(argv.size()), argv.data()) || !driver.processOptions())
        {
            result.error = "front end rejected its arguments";
            return result;
        }
        if (!driver.parseAllSources())
        {
            result.error = "front end could not parse the sources";
            return result;
        }

        auto compilation = driver.createCompilation();
        if (!compilation)
        {
            result.error = "front end produced no compilation";
            return result;
        }
        driver.reportCompilation(*compilation, /* quiet */ true);
        if (driver.diagEngine.getNumErrors() > 0)
        {
            result.error = "front end reported " + std::to_string(driver.diagEngine.getNumErrors()) + " error(s)";
            return result;
        }

        const slang::ast::InstanceSymbol *instance = nullptr;
        for (const slang::ast::InstanceSymbol *candidate : compilation->getRoot().topInstances)
        {
            if (candidate && candidate->name == top)
            {
                instance = candidate;
                break;
            }
        }
        if (!instance)
        {
            result.error = "module '" + std::string(top) + "' not found";
            return result;
        }

        std::vector<design::Port> ports;
        for (const slang::ast::Symbol *portSymbol : instance->body.getPortList())
        {
            if (!portSymbol)
            {
                continue;
            }
            const auto *port = portSymbol->as_if<slang::ast::PortSymbol>();
            if (!port || port->isNullPort || port->name.empty())
            {
                result.error = "module '" + std::string(top) + "' has a port the probe cannot describe";
                return result;
            }
            auto direction = mapDirection(port->direction);
            if (!direction)
            {
                result.error = "port '" + std::string(port->name) + "' has an unsupported direction";
                return result;
            }
            const auto width = static_cast<int64_t>(port->getType().getBitWidth());
            ports.push_back(design::Port{
                .name = std::string(port->name),
                .width = width > 0 ? width : 1,
                .direction = *direction,
            });
        }
        result.ports = std::move(ports);
        return result;
    }

    std::optional<std::string> describeMismatch(std::string_view module,
                                                const std::vector<design::Port> &expected,
                                                const std::vector<design::Port> &actual)
    {
        std::string lines;
        auto addLine = [&](const std::string &detail) {
            lines.append(module);
            lines.append(".v:1: error: port mismatch: ");
            lines.append(detail);
            lines.push_back('\n');
        };

        for (const design::Port &want : expected)
        {
            const design::Port *have = findPort(actual, want.name);
            if (!have)
            {
                addLine("missing port '" + want.name + "' (expected " + design::formatPort(want) + ")");
                continue;
            }
            if (have->direction != want.direction)
            {
                addLine("port direction of '" + want.name + "' is " + design::toString(have->direction) +
                        ", expected " + design::toString(want.direction));
            }
            if (have->width != want.width)
            {
                addLine("port width of '" + want.name + "' is " + std::to_string(have->width) + ", expected " +
                        std::to_string(want.width));
            }
        }
        for (const design::Port &have : actual)
        {
            if (!findPort(expected, have.name))
            {
                addLine("unexpected port '" + have.name + "' (" + design::formatPort(have) + ")");
            }
        }

        if (lines.empty())
        {
            return std::nullopt;
        }
        lines.append("expected ports: ");
        lines.append(design::formatPortList(expected));
        lines.push_back('\n');
        return lines;
    }

} // namespace veriloop::lib::probe
