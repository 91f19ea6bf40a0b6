#include "config.hpp"

#include "json.hpp"

#include <fstream>
#include <functional>
#include <sstream>
#include <unordered_map>

namespace veriloop::lib::config
{

    namespace
    {

        using json::JsonValue;

        std::string keyContext(std::string_view source, std::string_view key)
        {
            std::string ctx(source);
            ctx.append(": ");
            ctx.append(key);
            return ctx;
        }

        std::string readString(const JsonValue &value, const std::string &ctx)
        {
            if (!value.isString())
            {
                throw ConfigError(ctx + " must be a string");
            }
            return value.asString(ctx);
        }

        bool readBool(const JsonValue &value, const std::string &ctx)
        {
            if (!value.isBool())
            {
                throw ConfigError(ctx + " must be a boolean");
            }
            return value.asBool(ctx);
        }

        int64_t readInt(const JsonValue &value, const std::string &ctx, int64_t minValue, int64_t maxValue)
        {
            if (!value.isInt())
            {
                throw ConfigError(ctx + " must be an integer");
            }
            const int64_t result = value.asInt(ctx);
            if (result < minValue || result > maxValue)
            {
                throw ConfigError(ctx + " out of range [" + std::to_string(minValue) + ", " +
                                  std::to_string(maxValue) + "]: " + std::to_string(result));
            }
            return result;
        }

        std::vector<std::string> readStringList(const JsonValue &value, const std::string &ctx)
        {
            if (!value.isArray())
            {
                throw ConfigError(ctx + " must be an array of strings");
            }
            std::vector<std::string> result;
            for (const JsonValue &item : value.asArray(ctx))
            {
                result.push_back(readString(item, ctx + "[]"));
            }
            return result;
        }

        using Setter = std::function<void(RunConfig &, const JsonValue &, const std::string &)>;

        const std::unordered_map<std::string, Setter> &setters()
        {
            constexpr int64_t kMaxTimeoutMs = 24LL * 60 * 60 * 1000;
            static const std::unordered_map<std::string, Setter> table = {
                {"provider", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) {
                     const std::string text = readString(v, ctx);
                     auto provider = parseProvider(text);
                     if (!provider)
                     {
                         throw ConfigError(ctx + " unknown provider '" + text + "' (expected ollama, openai or command)");
                     }
                     cfg.provider = *provider;
                 }},
                {"model", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.model = readString(v, ctx); }},
                {"endpoint", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.endpoint = readString(v, ctx); }},
                {"api_key_env", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.apiKeyEnv = readString(v, ctx); }},
                {"generator_exec", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.generatorExec = readString(v, ctx); }},
                {"generator_args", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.generatorArgs = readStringList(v, ctx); }},
                {"generation_timeout_ms", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) {
                     cfg.generationTimeout = std::chrono::milliseconds(readInt(v, ctx, 1, kMaxTimeoutMs));
                 }},
                {"extra_instructions", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.extraInstructions = readString(v, ctx); }},
                {"max_retries", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) {
                     cfg.maxRetries = static_cast<uint32_t>(readInt(v, ctx, 1, 1000));
                 }},
                {"parallelism", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) {
                     cfg.parallelism = static_cast<uint32_t>(readInt(v, ctx, 1, 256));
                 }},
                {"run_budget_s", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) {
                     cfg.runBudget = std::chrono::seconds(readInt(v, ctx, 0, 7LL * 24 * 60 * 60));
                 }},
                {"compiler", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.compiler = readString(v, ctx); }},
                {"compile_flags", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.compileFlags = readStringList(v, ctx); }},
                {"simulator", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.simulator = readString(v, ctx); }},
                {"sim_flags", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.simFlags = readStringList(v, ctx); }},
                {"compile_timeout_ms", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) {
                     cfg.compileTimeout = std::chrono::milliseconds(readInt(v, ctx, 1, kMaxTimeoutMs));
                 }},
                {"sim_timeout_ms", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) {
                     cfg.simTimeout = std::chrono::milliseconds(readInt(v, ctx, 1, kMaxTimeoutMs));
                 }},
                {"interface_check", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.interfaceCheck = readBool(v, ctx); }},
                {"workspace_dir", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.workspaceDir = readString(v, ctx); }},
                {"designs_dir", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.designsDir = readString(v, ctx); }},
                {"save_on_success", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.saveOnSuccess = readBool(v, ctx); }},
                {"show_diffs", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) { cfg.showDiffs = readBool(v, ctx); }},
                {"log_level", [](RunConfig &cfg, const JsonValue &v, const std::string &ctx) {
                     const std::string text = readString(v, ctx);
                     auto level = parseLogLevel(text);
                     if (!level)
                     {
                         throw ConfigError(ctx + " unknown log level '" + text + "'");
                     }
                     cfg.logLevel = *level;
                 }},
            };
            return table;
        }

    } // namespace

    const char *toString(Provider provider) noexcept
    {
        switch (provider)
        {
        case Provider::Ollama:
            return "ollama";
        case Provider::OpenAI:
            return "openai";
        case Provider::Command:
        default:
            return "command";
        }
    }

    std::optional<Provider> parseProvider(std::string_view text)
    {
        if (text == "ollama")
        {
            return Provider::Ollama;
        }
        if (text == "openai")
        {
            return Provider::OpenAI;
        }
        if (text == "command")
        {
            return Provider::Command;
        }
        return std::nullopt;
    }

    RunConfig parseConfig(std::string_view text, diag::Diagnostics &diags, std::string_view source)
    {
        JsonValue root;
        try
        {
            root = json::parse(text);
        }
        catch (const json::JsonError &ex)
        {
            throw ConfigError(std::string(source) + ": " + ex.what());
        }
        if (!root.isObject())
        {
            throw ConfigError(std::string(source) + ": top-level value must be an object");
        }

        RunConfig config;
        const auto &table = setters();
        for (const auto &[key, value] : root.asObject(source))
        {
            auto it = table.find(key);
            if (it == table.end())
            {
                diags.warning("unknown config key '" + key + "' ignored", std::string(source));
                continue;
            }
            it->second(config, value, keyContext(source, key));
        }
        validate(config);
        return config;
    }

    RunConfig loadConfig(const std::optional<std::filesystem::path> &path, diag::Diagnostics &diags)
    {
        std::filesystem::path file = path ? *path : std::filesystem::path(std::string(kDefaultConfigFile));
        std::error_code ec;
        if (!std::filesystem::exists(file, ec))
        {
            if (path)
            {
                throw ConfigError("config file not found: " + file.string());
            }
            diags.debug("no " + file.string() + " found, using defaults");
            return RunConfig{};
        }

        std::ifstream stream(file, std::ios::binary);
        if (!stream)
        {
            throw ConfigError("failed to open config file: " + file.string());
        }
        std::ostringstream buffer;
        buffer << stream.rdbuf();
        return parseConfig(buffer.str(), diags, file.string());
    }

    void validate(const RunConfig &config)
    {
        if (config.maxRetries < 1)
        {
            throw ConfigError("max_retries must be at least 1");
        }
        if (config.parallelism < 1)
        {
            throw ConfigError("parallelism must be at least 1");
        }
        if (config.model.empty() && config.provider != Provider::Command)
        {
            throw ConfigError("model must not be empty");
        }
        if (config.provider == Provider::Command && config.generatorExec.empty())
        {
            throw ConfigError("provider 'command' requires generator_exec");
        }
        if (config.compiler.empty() || config.simulator.empty())
        {
            throw ConfigError("compiler and simulator must not be empty");
        }
        if (config.compileTimeout.count() <= 0 || config.simTimeout.count() <= 0 ||
            config.generationTimeout.count() <= 0)
        {
            throw ConfigError("timeouts must be positive");
        }
        if (config.runBudget.count() < 0)
        {
            throw ConfigError("run_budget_s must not be negative");
        }
    }

} // namespace veriloop::lib::config
