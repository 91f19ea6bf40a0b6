#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "slang/util/CommandLine.h"

#include "config.hpp"
#include "design.hpp"
#include "diagnostics.hpp"
#include "generation.hpp"
#include "logging.hpp"
#include "orchestrator.hpp"
#include "plan.hpp"
#include "process.hpp"
#include "prompts.hpp"
#include "store.hpp"
#include "verify.hpp"

namespace {

using TimingClock = std::chrono::steady_clock;

constexpr int kExitVerified = 0;
constexpr int kExitUsage = 1;
constexpr int kExitPartial = 2;
constexpr int kExitAborted = 3;
constexpr int kExitStore = 4;

std::atomic<veriloop::lib::proc::CancellationToken *> gInterruptToken{nullptr};

extern "C" void handleInterrupt(int)
{
    if (auto *token = gInterruptToken.load())
    {
        token->cancel();
    }
}

std::string formatDuration(TimingClock::duration duration)
{
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    if (ms > 0)
    {
        return std::to_string(ms) + "ms";
    }
    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(duration).count();
    if (us > 0)
    {
        return std::to_string(us) + "us";
    }
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count();
    return std::to_string(ns) + "ns";
}

veriloop::lib::LogLevel levelFor(veriloop::lib::diag::DiagnosticKind kind)
{
    switch (kind)
    {
    case veriloop::lib::diag::DiagnosticKind::Error:
        return veriloop::lib::LogLevel::Error;
    case veriloop::lib::diag::DiagnosticKind::Warning:
        return veriloop::lib::LogLevel::Warn;
    case veriloop::lib::diag::DiagnosticKind::Info:
        return veriloop::lib::LogLevel::Info;
    case veriloop::lib::diag::DiagnosticKind::Debug:
    default:
        return veriloop::lib::LogLevel::Debug;
    }
}

// "<name>:<direction>[:<width>]", e.g. "sum:output:4".
std::optional<veriloop::lib::design::Port> parsePortHint(std::string_view text)
{
    const std::size_t first = text.find(':');
    if (first == std::string_view::npos)
    {
        return std::nullopt;
    }
    veriloop::lib::design::Port port;
    port.name = std::string(text.substr(0, first));
    std::string_view rest = text.substr(first + 1);
    std::string_view widthText;
    if (const std::size_t second = rest.find(':'); second != std::string_view::npos)
    {
        widthText = rest.substr(second + 1);
        rest = rest.substr(0, second);
    }
    const auto direction = veriloop::lib::design::parsePortDirection(rest);
    if (!direction || !veriloop::lib::design::isIdentifier(port.name))
    {
        return std::nullopt;
    }
    port.direction = *direction;
    if (!widthText.empty())
    {
        int64_t width = 0;
        for (char c : widthText)
        {
            if (c < '0' || c > '9' || width > 65536)
            {
                return std::nullopt;
            }
            width = width * 10 + (c - '0');
        }
        if (width < 1)
        {
            return std::nullopt;
        }
        port.width = width;
    }
    return port;
}

std::optional<std::string> readTextFile(const std::filesystem::path &path)
{
    std::ifstream stream(path, std::ios::in | std::ios::binary);
    if (!stream.is_open())
    {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    return buffer.str();
}

int exitCodeFor(veriloop::lib::design::DesignStatus status)
{
    switch (status)
    {
    case veriloop::lib::design::DesignStatus::Verified:
        return kExitVerified;
    case veriloop::lib::design::DesignStatus::PartiallyFailed:
        return kExitPartial;
    case veriloop::lib::design::DesignStatus::Aborted:
    default:
        return kExitAborted;
    }
}

} // namespace

namespace veriloop::app::cli
{

int run(int argc, char **argv)
{
    using namespace veriloop::lib;

    slang::CommandLine cmdLine;

    std::optional<bool> showHelp;
    cmdLine.add("-h,--help", showHelp, "Display available options");
    std::optional<std::string> configPath;
    cmdLine.add("--config", configPath, "JSON configuration file (default ./veriloop.json when present)",
                "<file>", slang::CommandLineFlags::FilePath);
    std::optional<std::string> modelArg;
    cmdLine.add("--model", modelArg, "Model name passed to the generation backend", "<name>");
    std::optional<std::string> providerArg;
    cmdLine.add("--provider", providerArg, "Generation backend: ollama|openai|command", "<provider>");
    std::optional<uint32_t> maxRetriesArg;
    cmdLine.add("--max-retries", maxRetriesArg, "Total attempts per module before giving up", "<count>");
    std::optional<uint32_t> parallelArg;
    cmdLine.add("--parallel", parallelArg, "Verify independent modules on up to <n> workers", "<n>");
    std::optional<int64_t> timeoutSeconds;
    cmdLine.add("--timeout", timeoutSeconds, "Overall run budget in seconds", "<sec>");
    std::optional<std::string> planPath;
    cmdLine.add("--plan", planPath, "Use a decomposition document instead of asking the backend", "<file>",
                slang::CommandLineFlags::FilePath);
    std::optional<bool> singleMode;
    cmdLine.add("--single", singleMode, "Generate the request as one module without decomposition");
    std::optional<std::string> topName;
    cmdLine.add("--top", topName, "Module name used with --single (default top)", "<name>");
    std::optional<std::string> designName;
    cmdLine.add("--name", designName, "Name of the saved design directory", "<name>");
    std::vector<std::string> portHints;
    cmdLine.add("--port", portHints, "Interface hint for the top module, <name>:<direction>[:<width>]",
                "<port>");
    std::optional<std::string> reportPath;
    cmdLine.add("--report", reportPath, "Write the full run report as JSON", "<file>",
                slang::CommandLineFlags::FilePath);
    std::optional<bool> noSave;
    cmdLine.add("--no-save", noSave, "Do not save the verified design");
    std::optional<std::string> logLevel;
    cmdLine.add("--log", logLevel, "Log level: none|error|warn|info|debug|trace", "<level>");
    std::optional<bool> profileTimer;
    cmdLine.add("--profile-timer", profileTimer, "Emit timing logs for planning, execution and storage");
    std::vector<std::string> positional;
    cmdLine.setPositional(positional, "prompt");

    if (!cmdLine.parse(argc, argv))
    {
        for (const auto &error : cmdLine.getErrors())
        {
            std::cerr << "[veriloop] [error] " << error << '\n';
        }
        return kExitUsage;
    }
    if (showHelp == true)
    {
        std::cout << cmdLine.getHelpText("veriloop: plan, generate and verify Verilog designs");
        return kExitVerified;
    }

    std::string prompt;
    for (const std::string &part : positional)
    {
        if (!prompt.empty())
        {
            prompt.push_back(' ');
        }
        prompt.append(part);
    }
    if (prompt.empty() && !planPath)
    {
        std::cerr << "[veriloop] [error] missing design prompt\n";
        return kExitUsage;
    }
    if (timeoutSeconds && *timeoutSeconds <= 0)
    {
        std::cerr << "[timeout] Value must be a positive number of seconds\n";
        return kExitUsage;
    }
    if (singleMode == true && planPath)
    {
        std::cerr << "[veriloop] [error] --single and --plan cannot be combined\n";
        return kExitUsage;
    }

    const auto pipelineStart = TimingClock::now();
    diag::Diagnostics configDiagnostics("config");
    config::RunConfig settings;
    try
    {
        std::optional<std::filesystem::path> path;
        if (configPath)
        {
            path = *configPath;
        }
        settings = config::loadConfig(path, configDiagnostics);
        if (providerArg)
        {
            const auto provider = config::parseProvider(*providerArg);
            if (!provider)
            {
                throw config::ConfigError("unknown provider '" + *providerArg + "'");
            }
            settings.provider = *provider;
        }
        if (modelArg)
        {
            settings.model = *modelArg;
        }
        if (maxRetriesArg)
        {
            settings.maxRetries = *maxRetriesArg;
        }
        if (parallelArg)
        {
            settings.parallelism = *parallelArg;
        }
        if (timeoutSeconds)
        {
            settings.runBudget = std::chrono::seconds(*timeoutSeconds);
        }
        if (noSave == true)
        {
            settings.saveOnSuccess = false;
        }
        if (logLevel && !logLevel->empty())
        {
            const auto parsed = parseLogLevel(*logLevel);
            if (!parsed)
            {
                throw config::ConfigError("unknown log level '" + *logLevel + "'");
            }
            settings.logLevel = *parsed;
        }
        config::validate(settings);
    }
    catch (const config::ConfigError &ex)
    {
        for (const auto &message : configDiagnostics.messages())
        {
            std::cerr << "[config] [" << diag::diagnosticKindText(message.kind) << "] " << message.message << '\n';
        }
        std::cerr << "[config] [error] " << ex.what() << '\n';
        return kExitUsage;
    }

    std::vector<design::Port> hints;
    for (const std::string &text : portHints)
    {
        const auto port = parsePortHint(text);
        if (!port)
        {
            std::cerr << "[veriloop] [error] malformed --port '" << text << "'\n";
            return kExitUsage;
        }
        hints.push_back(*port);
    }

    const bool timingEnabled = profileTimer == true;
    LogLevel globalLogLevel = settings.logLevel;
    const bool logLevelExplicit = logLevel && !logLevel->empty();
    if (timingEnabled && !logLevelExplicit &&
        static_cast<int>(globalLogLevel) > static_cast<int>(LogLevel::Debug))
    {
        globalLogLevel = LogLevel::Debug;
    }

    std::mutex outputMutex;
    auto shouldLog = [&](LogLevel level) -> bool {
        if (globalLogLevel == LogLevel::Off)
        {
            return false;
        }
        return static_cast<int>(level) >= static_cast<int>(globalLogLevel);
    };
    auto logLine = [&](LogLevel level, std::string_view prefix, std::string_view tag, std::string_view message) {
        if (!shouldLog(level))
        {
            return;
        }
        std::lock_guard<std::mutex> lock(outputMutex);
        std::cerr << "[" << prefix << "] [" << logLevelText(level) << "]";
        if (!tag.empty())
        {
            std::cerr << " [" << tag << "]";
        }
        std::cerr << " " << message << '\n';
    };
    auto logTimingStage = [&](std::string_view label, TimingClock::time_point stageStart,
                              TimingClock::time_point stageEnd) {
        if (!timingEnabled)
        {
            return;
        }
        std::string message;
        message.reserve(label.size() + 48);
        message.append(label);
        message.append(" took ");
        message.append(formatDuration(stageEnd - stageStart));
        message.append(" (total ");
        message.append(formatDuration(stageEnd - pipelineStart));
        message.append(")");
        std::lock_guard<std::mutex> lock(outputMutex);
        std::cerr << "[veriloop] [timing] " << message << '\n';
    };
    auto reportDiagnostics = [&](const diag::Diagnostics &diagnostics, std::string_view prefix) {
        for (const auto &message : diagnostics.messages())
        {
            std::string text = message.message;
            if (!message.context.empty())
            {
                text.append(" (");
                text.append(message.context);
                text.append(")");
            }
            logLine(levelFor(message.kind), prefix, message.node, text);
        }
    };

    reportDiagnostics(configDiagnostics, "config");

    Logger logger;
    logger.setLevel(globalLogLevel);
    logger.setSink([&](const LogEvent &event) { logLine(event.level, "veriloop", event.tag, event.message); });
    if (globalLogLevel != LogLevel::Off)
    {
        logger.enable();
    }

    proc::CancellationToken cancel;
    gInterruptToken.store(&cancel);
    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);
    struct InterruptGuard
    {
        ~InterruptGuard()
        {
            std::signal(SIGINT, SIG_DFL);
            std::signal(SIGTERM, SIG_DFL);
            gInterruptToken.store(nullptr);
        }
    } interruptGuard;

    std::optional<gen::CommandGenerationClient> client;
    try
    {
        client.emplace(gen::CommandGenerationClient::fromConfig(settings, &cancel, &logger));
    }
    catch (const gen::GenerationError &ex)
    {
        logLine(LogLevel::Error, "veriloop", "generate", ex.what());
        return kExitUsage;
    }
    logLine(LogLevel::Info, "veriloop", {},
            std::string("backend ") + config::toString(settings.provider) + " model=" + settings.model +
                " max_retries=" + std::to_string(settings.maxRetries) +
                " parallel=" + std::to_string(settings.parallelism));

    const gen::PromptBuilder prompts(settings.extraInstructions);
    verify::ToolchainOptions toolchain = verify::ToolchainOptions::fromConfig(settings);
    toolchain.markers = prompts.markers();
    verify::IcarusRunner runner(std::move(toolchain), &logger);

    diag::Diagnostics runDiagnostics("plan");
    flow::OrchestratorOptions options;
    options.maxRetries = settings.maxRetries;
    options.parallelism = settings.parallelism;
    options.runBudget = std::chrono::duration_cast<std::chrono::milliseconds>(settings.runBudget);
    options.simTimeout = settings.simTimeout;
    flow::Orchestrator orchestrator(*client, runner, prompts, options, cancel, &logger, &runDiagnostics);

    std::mutex previousMutex;
    std::map<std::string, std::string> previousImplementation;
    if (settings.showDiffs)
    {
        orchestrator.setAttemptObserver([&](const design::PlanNode &node, const design::Attempt &attempt) {
            if (attempt.implementation.empty())
            {
                return;
            }
            std::string before;
            {
                std::lock_guard<std::mutex> lock(previousMutex);
                std::string &slot = previousImplementation[node.name];
                before = std::exchange(slot, attempt.implementation);
            }
            if (before.empty() || !shouldLog(LogLevel::Info))
            {
                return;
            }
            const std::string diff =
                store::unifiedDiff(before, attempt.implementation,
                                   node.name + ".v (attempt " + std::to_string(attempt.index - 1) + ")",
                                   node.name + ".v (attempt " + std::to_string(attempt.index) + ")");
            if (diff.empty())
            {
                logLine(LogLevel::Info, "veriloop", "diff", node.name + ": implementation unchanged");
                return;
            }
            std::lock_guard<std::mutex> lock(outputMutex);
            std::cerr << diff;
        });
    }

    design::DesignRequest request;
    request.prompt = prompt;
    request.interfaceHints = hints;
    request.name = designName.value_or(std::string());

    const auto runStart = TimingClock::now();
    design::DesignResult result;
    if (planPath || singleMode == true)
    {
        try
        {
            std::optional<plan::DesignPlan> fixedPlan;
            if (planPath)
            {
                const std::optional<std::string> text = readTextFile(*planPath);
                if (!text)
                {
                    logLine(LogLevel::Error, "veriloop", "plan", "cannot read plan file " + *planPath);
                    return kExitUsage;
                }
                fixedPlan.emplace(plan::PlanBuilder::parse(*text, hints, &runDiagnostics));
            }
            else
            {
                fixedPlan.emplace(plan::PlanBuilder::singleModule(request, topName.value_or(std::string("top"))));
            }
            result = orchestrator.execute(*fixedPlan);
        }
        catch (const plan::PlanningError &ex)
        {
            reportDiagnostics(runDiagnostics, "plan");
            logLine(LogLevel::Error, "veriloop", "plan",
                    std::string("invalid plan (") + plan::toString(ex.kind()) + "): " + ex.what());
            return kExitUsage;
        }
    }
    else
    {
        result = orchestrator.run(request);
    }
    logTimingStage("run", runStart, TimingClock::now());
    reportDiagnostics(runDiagnostics, "plan");

    for (const design::ModuleResult &module : result.modules)
    {
        std::string line = module.node + ": " + design::toString(module.status) + " (" +
                           std::to_string(module.attemptCount()) + " attempt(s))";
        if (!module.reason.empty())
        {
            line.append(" ");
            line.append(module.reason);
        }
        logLine(module.status == design::ModuleStatus::Verified ? LogLevel::Info : LogLevel::Warn, "veriloop",
                "result", line);
        if (module.status == design::ModuleStatus::Exhausted && !module.lastDiagnostic.empty())
        {
            logLine(LogLevel::Warn, "veriloop", "result", module.node + ": " + module.lastDiagnostic);
        }
    }
    std::string summary = std::string("design ") + design::toString(result.status);
    if (!result.reason.empty())
    {
        summary.append(": ");
        summary.append(result.reason);
    }
    logLine(result.status == design::DesignStatus::Verified ? LogLevel::Info : LogLevel::Error, "veriloop", {},
            summary);

    bool storeOk = true;
    const auto storeStart = TimingClock::now();
    if (reportPath && !reportPath->empty())
    {
        store::StoreDiagnostics storeDiagnostics("store");
        store::ReportStore reportStore(&storeDiagnostics);
        const std::filesystem::path path(*reportPath);
        store::StoreOptions storeOptions;
        if (!path.parent_path().empty())
        {
            storeOptions.outputDir = path.parent_path().string();
        }
        storeOptions.outputFilename = path.filename().string();
        const store::StoreResult stored = reportStore.store(result, storeOptions);
        reportDiagnostics(storeDiagnostics, "store");
        if (stored.success && !stored.artifacts.empty())
        {
            logLine(LogLevel::Info, "store", {}, "Wrote report to " + stored.artifacts.front());
        }
        storeOk = storeOk && stored.success;
    }
    if (result.status == design::DesignStatus::Verified)
    {
        if (settings.saveOnSuccess)
        {
            store::StoreDiagnostics storeDiagnostics("store");
            store::DesignStore designStore(&storeDiagnostics);
            store::StoreOptions storeOptions;
            storeOptions.outputDir = settings.designsDir.string();
            if (designName && !designName->empty())
            {
                storeOptions.outputFilename = *designName;
            }
            const store::StoreResult stored = designStore.store(result, storeOptions);
            reportDiagnostics(storeDiagnostics, "store");
            if (stored.success && !stored.artifacts.empty())
            {
                logLine(LogLevel::Info, "store", {},
                        "Saved design to " + std::filesystem::path(stored.artifacts.front()).parent_path().string());
            }
            storeOk = storeOk && stored.success;
        }
        else
        {
            std::lock_guard<std::mutex> lock(outputMutex);
            std::cout << result.integratedDesign;
        }
    }
    logTimingStage("store", storeStart, TimingClock::now());

    if (!storeOk)
    {
        logLine(LogLevel::Error, "store", {}, "Failed to write artifacts");
        return kExitStore;
    }
    return exitCodeFor(result.status);
}

} // namespace veriloop::app::cli

int main(int argc, char **argv)
{
    return veriloop::app::cli::run(argc, argv);
}
