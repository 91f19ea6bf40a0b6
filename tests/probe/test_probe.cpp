#include "classify.hpp"
#include "probe.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#ifndef VERILOOP_TEST_DATA_DIR
#error "VERILOOP_TEST_DATA_DIR must be defined"
#endif

using namespace veriloop::lib;
using design::Port;
using design::PortDirection;

namespace
{

    int fail(const std::string &message)
    {
        std::cerr << "[probe-tests] " << message << '\n';
        return 1;
    }

    const std::vector<Port> kCounterPorts{
        {"clk", 1, PortDirection::Input},
        {"rst", 1, PortDirection::Input},
        {"en", 1, PortDirection::Input},
        {"count", 4, PortDirection::Output},
    };

} // namespace

int main()
{
    const std::filesystem::path data = std::filesystem::path(VERILOOP_TEST_DATA_DIR) / "probe";

    // Ports read back in declaration order
    {
        const probe::InterfaceReadResult read = probe::readInterface("counter", {data / "counter.v"});
        if (!read.ports)
        {
            return fail("counter interface not read: " + read.error);
        }
        if (*read.ports != kCounterPorts)
        {
            return fail("counter ports differ: " + design::formatPortList(*read.ports));
        }
    }

    // Unparseable sources and unknown tops are skipped, not thrown
    {
        const probe::InterfaceReadResult broken = probe::readInterface("broken", {data / "broken.v"});
        if (broken.ports || broken.error.empty())
        {
            return fail("broken source produced an interface");
        }
        const probe::InterfaceReadResult missing = probe::readInterface("nonexistent", {data / "counter.v"});
        if (missing.ports || missing.error.empty())
        {
            return fail("unknown top produced an interface");
        }
    }

    // Matching interfaces produce no report
    {
        if (probe::describeMismatch("counter", kCounterPorts, kCounterPorts))
        {
            return fail("identical port lists reported as mismatched");
        }
    }

    // Each difference is one classifiable line
    {
        std::vector<Port> actual = kCounterPorts;
        actual[3].width = 8;
        actual[2].direction = PortDirection::Output;
        actual.erase(actual.begin() + 1);
        actual.push_back({"load", 1, PortDirection::Input});

        const auto report = probe::describeMismatch("counter", kCounterPorts, actual);
        if (!report)
        {
            return fail("differences not reported");
        }
        for (const char *needle : {"missing port 'rst'", "port direction of 'en'", "port width of 'count' is 8",
                                   "unexpected port 'load'", "expected ports: "})
        {
            if (report->find(needle) == std::string::npos)
            {
                return fail(std::string("report lacks '") + needle + "':\n" + *report);
            }
        }

        const design::Diagnosis diagnosis =
            classify::DiagnosticClassifier().classify(*report, classify::Phase::Compile);
        if (diagnosis.category != design::FailureCategory::PortMismatch || diagnosis.file != "counter.v" ||
            diagnosis.harnessImplicated)
        {
            return fail("mismatch report not classified as PortMismatch in counter.v");
        }
    }

    return 0;
}
