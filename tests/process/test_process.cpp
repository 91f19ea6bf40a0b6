#include "process.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#ifndef VERILOOP_TEST_ARTIFACT_DIR
#error "VERILOOP_TEST_ARTIFACT_DIR must be defined"
#endif

using namespace veriloop::lib;

namespace
{

    int fail(const std::string &message)
    {
        std::cerr << "[process-tests] " << message << '\n';
        return 1;
    }

    proc::ProcessSpec shell(std::string script)
    {
        proc::ProcessSpec spec;
        spec.program = "sh";
        spec.args = {"-c", std::move(script)};
        spec.timeout = std::chrono::milliseconds(10000);
        return spec;
    }

} // namespace

int main()
{
    // Both streams captured
    {
        const proc::ProcessResult result = proc::runProcess(shell("echo out; echo err 1>&2"));
        if (!result.succeeded())
        {
            return fail("echo did not succeed: " + result.launchError);
        }
        if (result.out != "out\n" || result.err != "err\n")
        {
            return fail("captured streams differ: out='" + result.out + "' err='" + result.err + "'");
        }
        if (result.combinedOutput() != "err\nout\n")
        {
            return fail("combined output order wrong: " + result.combinedOutput());
        }
    }

    // Exit status
    {
        const proc::ProcessResult result = proc::runProcess(shell("exit 3"));
        if (!result.launched || result.timedOut || result.exitCode != 3 || result.succeeded())
        {
            return fail("exit status 3 not reported, got " + std::to_string(result.exitCode));
        }
    }

    // Stdin is fed and closed
    {
        proc::ProcessSpec spec = shell("cat");
        spec.input = std::string("{\"model\": \"x\"}");
        const proc::ProcessResult result = proc::runProcess(spec);
        if (!result.succeeded() || result.out != "{\"model\": \"x\"}")
        {
            return fail("stdin not passed through: '" + result.out + "'");
        }
        const proc::ProcessResult closed = proc::runProcess(shell("cat"));
        if (!closed.succeeded() || !closed.out.empty())
        {
            return fail("cat without input did not see end of file");
        }
    }

    // Working directory
    {
        const std::filesystem::path dir = std::filesystem::path(VERILOOP_TEST_ARTIFACT_DIR) / "process-cwd";
        std::filesystem::create_directories(dir);
        proc::ProcessSpec spec = shell("pwd");
        spec.workingDir = dir;
        const proc::ProcessResult result = proc::runProcess(spec);
        if (!result.succeeded() ||
            std::filesystem::weakly_canonical(result.out.substr(0, result.out.size() - 1)) !=
                std::filesystem::weakly_canonical(dir))
        {
            return fail("process did not start in the working directory: " + result.out);
        }
    }

    // Timeout kills the child and its descendants
    {
        proc::ProcessSpec spec = shell("sleep 30 & sleep 30; echo late");
        spec.timeout = std::chrono::milliseconds(300);
        const auto start = std::chrono::steady_clock::now();
        const proc::ProcessResult result = proc::runProcess(spec);
        const auto elapsed = std::chrono::steady_clock::now() - start;
        if (!result.timedOut || result.succeeded())
        {
            return fail("timeout not reported");
        }
        if (elapsed > std::chrono::seconds(5))
        {
            return fail("timed-out process was not killed promptly");
        }
        if (result.out.find("late") != std::string::npos)
        {
            return fail("process kept running after the timeout");
        }
    }

    // Cancellation from another thread
    {
        proc::CancellationToken token;
        std::thread canceller([&token]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            token.cancel();
        });
        const proc::ProcessResult result = proc::runProcess(shell("sleep 30"), &token);
        canceller.join();
        if (!result.cancelled || result.succeeded())
        {
            return fail("cancellation not reported");
        }

        const proc::ProcessResult again = proc::runProcess(shell("echo never"), &token);
        if (again.launched || !again.cancelled)
        {
            return fail("process launched with an already cancelled token");
        }
    }

    // Missing program
    {
        proc::ProcessSpec spec;
        spec.program = "veriloop-no-such-program";
        const proc::ProcessResult result = proc::runProcess(spec);
        if (result.launched || result.launchError.empty())
        {
            return fail("missing program reported as launched");
        }
    }

    return 0;
}
