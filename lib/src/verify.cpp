#include "verify.hpp"

#include "probe.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace veriloop::lib::verify
{

    namespace
    {

        constexpr std::string_view kSimImage = "sim.vvp";
        constexpr std::size_t kTailLimit = 4096;

        void writeFile(const std::filesystem::path &path, std::string_view text)
        {
            std::ofstream stream(path, std::ios::binary | std::ios::trunc);
            if (!stream)
            {
                throw std::runtime_error("failed to open " + path.string() + " for writing");
            }
            stream << text;
            if (!text.empty() && text.back() != '\n')
            {
                stream << '\n';
            }
            if (!stream)
            {
                throw std::runtime_error("failed to write " + path.string());
            }
        }

        bool startsWith(std::string_view text, std::string_view prefix)
        {
            return text.substr(0, prefix.size()) == prefix;
        }

        std::string outputTail(std::string_view text)
        {
            if (text.size() > kTailLimit)
            {
                text = text.substr(text.size() - kTailLimit);
            }
            return std::string(text);
        }

        std::string simulationText(const proc::ProcessResult &run)
        {
            // Simulator reports go to stdout; stderr only carries runtime failures.
            std::string text = run.out;
            if (!run.err.empty())
            {
                if (!text.empty() && text.back() != '\n')
                {
                    text.push_back('\n');
                }
                text.append(run.err);
            }
            return text;
        }

    } // namespace

    ToolchainOptions ToolchainOptions::fromConfig(const config::RunConfig &config)
    {
        ToolchainOptions options;
        options.compiler = config.compiler;
        options.compileFlags = config.compileFlags;
        options.simulator = config.simulator;
        options.simFlags = config.simFlags;
        options.compileTimeout = config.compileTimeout;
        options.simTimeout = config.simTimeout;
        options.interfaceCheck = config.interfaceCheck;
        options.workRoot = config.workspaceDir;
        return options;
    }

    design::VerificationOutcome evaluateSimulation(const proc::ProcessResult &run, const design::MarkerSet &markers)
    {
        const std::string output = simulationText(run);

        std::vector<std::string> failing;
        std::size_t passCount = 0;
        bool done = false;
        std::istringstream lines(output);
        std::string line;
        while (std::getline(lines, line))
        {
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            if (line.find(markers.fail) != std::string::npos || startsWith(line, "ERROR:") ||
                startsWith(line, "FATAL:"))
            {
                failing.push_back(line);
                continue;
            }
            if (line.find(markers.pass) != std::string::npos)
            {
                ++passCount;
            }
            if (line.find(markers.done) != std::string::npos)
            {
                done = true;
            }
        }

        if (!failing.empty())
        {
            return design::VerificationOutcome::makeLogicError(output, std::move(failing));
        }
        if (run.timedOut || run.cancelled)
        {
            std::string message = run.cancelled ? "simulation cancelled after "
                                                : "simulation exceeded its time limit after ";
            message.append(std::to_string(run.elapsed.count()));
            message.append("ms (missing $finish or a free-running loop?)\n");
            message.append(outputTail(output));
            return design::VerificationOutcome::makeTimeout(std::move(message));
        }
        if (run.exitCode != 0)
        {
            std::string message = "simulator exited with status " + std::to_string(run.exitCode) + "\n";
            message.append(output);
            return design::VerificationOutcome::makeLogicError(std::move(message), {});
        }
        if (!done)
        {
            std::string message = "simulation ended without the completion marker " + markers.done + "\n";
            message.append(outputTail(output));
            return design::VerificationOutcome::makeTimeout(std::move(message));
        }
        if (passCount == 0)
        {
            std::string message = "no test vectors: harness reported completion without any " + markers.pass +
                                  " line\n";
            message.append(output);
            return design::VerificationOutcome::makeLogicError(std::move(message), {});
        }
        return design::VerificationOutcome::makePassed(output);
    }

    std::filesystem::path IcarusRunner::makeWorkDir(std::string_view module)
    {
        const std::filesystem::path base = options_.workRoot / std::string(module);
        std::filesystem::create_directories(base);
        while (true)
        {
            std::ostringstream name;
            name << "run-" << std::setw(4) << std::setfill('0') << nextRun_.fetch_add(1);
            std::filesystem::path dir = base / name.str();
            if (std::filesystem::create_directory(dir))
            {
                return dir;
            }
        }
    }

    design::VerificationOutcome IcarusRunner::verify(const VerificationJob &job)
    {
        try
        {
            const std::filesystem::path dir = makeWorkDir(job.module);
            logTo(logger_, LogLevel::Debug, "verify", job.module + ": work dir " + dir.string());
            return runJob(job, dir);
        }
        catch (const std::runtime_error &ex)
        {
            return design::VerificationOutcome::makeToolUnavailable(std::string("workspace error: ") + ex.what());
        }
    }

    design::VerificationOutcome IcarusRunner::runJob(const VerificationJob &job, const std::filesystem::path &dir)
    {
        std::vector<std::string> sources;
        for (const SourceFile &lib : job.libraries)
        {
            const std::string file = lib.name + ".v";
            writeFile(dir / file, lib.text);
            sources.push_back(file);
        }
        const std::string designFile = job.module + ".v";
        const std::string harnessFile = "tb_" + job.module + ".v";
        writeFile(dir / designFile, job.implementation);
        writeFile(dir / harnessFile, job.harness);

        std::optional<std::vector<design::Port>> interface;
        if (options_.interfaceCheck)
        {
            std::vector<std::filesystem::path> files;
            for (const std::string &file : sources)
            {
                files.push_back(dir / file);
            }
            files.push_back(dir / designFile);
            probe::InterfaceReadResult read = probe::readInterface(job.module, files);
            if (read.ports)
            {
                if (!job.expectedPorts.empty())
                {
                    if (auto mismatch = probe::describeMismatch(job.module, job.expectedPorts, *read.ports))
                    {
                        logTo(logger_, LogLevel::Debug, "verify", job.module + ": interface check failed");
                        return design::VerificationOutcome::makeCompileError(std::move(*mismatch));
                    }
                }
                interface = std::move(read.ports);
            }
            else
            {
                logTo(logger_, LogLevel::Debug, "verify", job.module + ": interface check skipped: " + read.error);
            }
        }

        std::vector<std::string> compileArgs = options_.compileFlags;
        compileArgs.push_back("-o");
        compileArgs.emplace_back(kSimImage);
        compileArgs.insert(compileArgs.end(), sources.begin(), sources.end());
        compileArgs.push_back(designFile);
        compileArgs.push_back(harnessFile);

        const proc::ProcessSpec compileSpec{
            .program = options_.compiler,
            .args = std::move(compileArgs),
            .workingDir = dir,
            .timeout = options_.compileTimeout,
        };
        logTo(logger_, LogLevel::Trace, "verify", "exec " + proc::describeCommand(compileSpec));
        const proc::ProcessResult compiled = proc::runProcess(compileSpec, job.cancel);
        if (compiled.cancelled)
        {
            return design::VerificationOutcome::makeTimeout("compilation cancelled: run budget expired");
        }
        if (!compiled.launched)
        {
            return design::VerificationOutcome::makeToolUnavailable("cannot launch compiler '" + options_.compiler +
                                                                    "': " + compiled.launchError);
        }
        if (compiled.timedOut)
        {
            return design::VerificationOutcome::makeTimeout("compilation exceeded " +
                                                            std::to_string(options_.compileTimeout.count()) + "ms");
        }
        if (compiled.exitCode != 0)
        {
            std::string text = compiled.combinedOutput();
            if (text.empty())
            {
                text = "compiler exited with status " + std::to_string(compiled.exitCode);
            }
            return design::VerificationOutcome::makeCompileError(std::move(text));
        }

        std::vector<std::string> simArgs = options_.simFlags;
        simArgs.emplace_back(kSimImage);
        const proc::ProcessSpec simSpec{
            .program = options_.simulator,
            .args = std::move(simArgs),
            .workingDir = dir,
            .timeout = job.simTimeout.count() > 0 ? job.simTimeout : options_.simTimeout,
        };
        logTo(logger_, LogLevel::Trace, "verify", "exec " + proc::describeCommand(simSpec));
        const proc::ProcessResult simulated = proc::runProcess(simSpec, job.cancel);
        if (!simulated.launched && !simulated.cancelled)
        {
            return design::VerificationOutcome::makeToolUnavailable("cannot launch simulator '" + options_.simulator +
                                                                    "': " + simulated.launchError);
        }

        design::VerificationOutcome outcome = evaluateSimulation(simulated, options_.markers);
        if (outcome.passed())
        {
            outcome.interface = std::move(interface);
        }
        logTo(logger_, LogLevel::Debug, "verify",
              job.module + ": " + design::toString(outcome.kind) + " in " + dir.filename().string());
        return outcome;
    }

} // namespace veriloop::lib::verify
