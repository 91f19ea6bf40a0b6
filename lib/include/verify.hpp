#ifndef VERILOOP_VERIFY_HPP
#define VERILOOP_VERIFY_HPP

#include "config.hpp"
#include "design.hpp"
#include "logging.hpp"
#include "process.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace veriloop::lib::verify
{

    struct SourceFile
    {
        // Module name; written as <name>.v.
        std::string name;
        std::string text;
    };

    struct VerificationJob
    {
        std::string module;
        std::vector<design::Port> expectedPorts;
        std::string implementation;
        std::string harness;
        // Verified dependency implementations, dependency-first.
        std::vector<SourceFile> libraries;
        // Zero uses the runner's simulation timeout.
        std::chrono::milliseconds simTimeout{0};
        const proc::CancellationToken *cancel = nullptr;
    };

    class VerificationRunner
    {
    public:
        virtual ~VerificationRunner() = default;

        // Exactly one outcome per call; never throws for tool or workspace failures.
        virtual design::VerificationOutcome verify(const VerificationJob &job) = 0;
    };

    struct ToolchainOptions
    {
        std::string compiler = "iverilog";
        std::vector<std::string> compileFlags{"-g2005"};
        std::string simulator = "vvp";
        std::vector<std::string> simFlags{"-n"};
        std::chrono::milliseconds compileTimeout{30000};
        std::chrono::milliseconds simTimeout{10000};
        bool interfaceCheck = true;
        std::filesystem::path workRoot = "build";
        design::MarkerSet markers;

        static ToolchainOptions fromConfig(const config::RunConfig &config);
    };

    // Decides the outcome of a finished simulator run from its exit state and output.
    design::VerificationOutcome evaluateSimulation(const proc::ProcessResult &run, const design::MarkerSet &markers);

    // Compiles with Icarus Verilog (or a compatible compiler) and simulates with vvp, each call in
    // a fresh directory under workRoot/<module>/.
    class IcarusRunner : public VerificationRunner
    {
    public:
        explicit IcarusRunner(ToolchainOptions options, Logger *logger = nullptr)
            : options_(std::move(options)), logger_(logger)
        {
        }

        design::VerificationOutcome verify(const VerificationJob &job) override;

        const ToolchainOptions &options() const noexcept { return options_; }

    private:
        std::filesystem::path makeWorkDir(std::string_view module);
        design::VerificationOutcome runJob(const VerificationJob &job, const std::filesystem::path &dir);

        ToolchainOptions options_;
        Logger *logger_;
        std::atomic<uint64_t> nextRun_{1};
    };

} // namespace veriloop::lib::verify

#endif // VERILOOP_VERIFY_HPP
