#ifndef VERILOOP_CONFIG_HPP
#define VERILOOP_CONFIG_HPP

#include "diagnostics.hpp"
#include "logging.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace veriloop::lib::config
{

    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    enum class Provider
    {
        Ollama,
        OpenAI,
        Command
    };

    const char *toString(Provider provider) noexcept;
    std::optional<Provider> parseProvider(std::string_view text);

    inline constexpr std::string_view kDefaultConfigFile = "veriloop.json";

    // Settings for one run. Read once before the run starts and passed by const reference
    // afterwards.
    struct RunConfig
    {
        // Generation backend.
        Provider provider = Provider::Ollama;
        std::string model = "qwen2.5-coder:14b";
        // Empty selects the provider's default URL.
        std::string endpoint;
        // Name of the environment variable holding the bearer token (openai).
        std::string apiKeyEnv;
        // Executable for the `command` provider.
        std::string generatorExec;
        std::vector<std::string> generatorArgs;
        std::chrono::milliseconds generationTimeout{120000};
        std::string extraInstructions;

        // Retry loop.
        uint32_t maxRetries = 5;
        uint32_t parallelism = 1;
        // Zero means no overall limit.
        std::chrono::seconds runBudget{0};

        // Toolchain.
        std::string compiler = "iverilog";
        std::vector<std::string> compileFlags{"-g2005"};
        std::string simulator = "vvp";
        std::vector<std::string> simFlags{"-n"};
        std::chrono::milliseconds compileTimeout{30000};
        std::chrono::milliseconds simTimeout{10000};
        bool interfaceCheck = true;

        // Files.
        std::filesystem::path workspaceDir = "build";
        std::filesystem::path designsDir = "designs";
        bool saveOnSuccess = true;
        bool showDiffs = true;

        LogLevel logLevel = LogLevel::Info;
    };

    // Parses a JSON config document on top of the defaults. Unknown keys are reported to
    // `diags` as warnings; type and range errors throw ConfigError.
    RunConfig parseConfig(std::string_view text, diag::Diagnostics &diags, std::string_view source = "<config>");

    // Loads `path` if given (missing file is an error), otherwise veriloop.json from the
    // current directory when present, otherwise the defaults.
    RunConfig loadConfig(const std::optional<std::filesystem::path> &path, diag::Diagnostics &diags);

    // Range checks shared by the file loader and command-line overrides.
    void validate(const RunConfig &config);

} // namespace veriloop::lib::config

#endif // VERILOOP_CONFIG_HPP
