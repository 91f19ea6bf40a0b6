#include "generation.hpp"

#include "json.hpp"

#include "slang/text/Json.h"

#include <cctype>
#include <cstdlib>

namespace veriloop::lib::gen
{

    namespace
    {

        constexpr std::string_view kOllamaEndpoint = "http://localhost:11434/api/chat";
        constexpr std::string_view kOpenAIEndpoint = "https://api.openai.com/v1/chat/completions";
        constexpr std::string_view kDefaultKeyEnv = "OPENAI_API_KEY";
        constexpr std::size_t kStderrExcerpt = 512;

        std::string_view trim(std::string_view text)
        {
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            {
                text.remove_prefix(1);
            }
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            {
                text.remove_suffix(1);
            }
            return text;
        }

        std::string lowered(std::string_view text)
        {
            std::string out(text);
            for (char &c : out)
            {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            return out;
        }

        std::string tail(std::string_view text, std::size_t limit)
        {
            text = trim(text);
            if (text.size() > limit)
            {
                text = text.substr(text.size() - limit);
            }
            return std::string(text);
        }

        // Body of the first fenced block whose info string is `tag`.
        std::optional<std::string_view> fencedBlock(std::string_view text, std::string_view tag)
        {
            std::size_t pos = 0;
            while ((pos = text.find("```", pos)) != std::string_view::npos)
            {
                const std::size_t infoStart = pos + 3;
                const std::size_t lineEnd = text.find('\n', infoStart);
                if (lineEnd == std::string_view::npos)
                {
                    return std::nullopt;
                }
                const std::string info = lowered(trim(text.substr(infoStart, lineEnd - infoStart)));
                const std::size_t bodyStart = lineEnd + 1;
                const std::size_t close = text.find("```", bodyStart);
                if (info == tag)
                {
                    if (close == std::string_view::npos)
                    {
                        return text.substr(bodyStart);
                    }
                    return text.substr(bodyStart, close - bodyStart);
                }
                if (close == std::string_view::npos)
                {
                    return std::nullopt;
                }
                pos = close + 3;
            }
            return std::nullopt;
        }

        std::string curlEndpoint(const config::RunConfig &config, std::string_view fallback)
        {
            return config.endpoint.empty() ? std::string(fallback) : config.endpoint;
        }

        std::vector<std::string> curlArgs(std::string endpoint)
        {
            return {"-sS", "--fail", "-X", "POST", std::move(endpoint),
                    "-H", "Content-Type: application/json", "--data-binary", "@-"};
        }

    } // namespace

    BackendCommand makeBackendCommand(const config::RunConfig &config)
    {
        BackendCommand command;
        switch (config.provider)
        {
        case config::Provider::Ollama:
            command.program = "curl";
            command.args = curlArgs(curlEndpoint(config, kOllamaEndpoint));
            command.responsePath = "message.content";
            break;
        case config::Provider::OpenAI:
        {
            command.program = "curl";
            command.args = curlArgs(curlEndpoint(config, kOpenAIEndpoint));
            const std::string keyEnv = config.apiKeyEnv.empty() ? std::string(kDefaultKeyEnv) : config.apiKeyEnv;
            const char *key = std::getenv(keyEnv.c_str());
            if (key == nullptr || *key == '\0')
            {
                throw GenerationError("environment variable " + keyEnv + " is not set (required by provider openai)");
            }
            command.args.push_back("-H");
            command.args.push_back(std::string("Authorization: Bearer ") + key);
            command.responsePath = "choices[0].message.content";
            break;
        }
        case config::Provider::Command:
            if (config.generatorExec.empty())
            {
                throw GenerationError("provider 'command' requires generator_exec");
            }
            command.program = config.generatorExec;
            command.args = config.generatorArgs;
            break;
        }
        return command;
    }

    std::string buildChatRequest(std::string_view model, const Prompt &prompt)
    {
        slang::JsonWriter writer;
        writer.setPrettyPrint(false);
        writer.startObject();
        writer.writeProperty("model");
        writer.writeValue(model);
        writer.writeProperty("messages");
        writer.startArray();

        writer.startObject();
        writer.writeProperty("role");
        writer.writeValue(std::string_view("system"));
        writer.writeProperty("content");
        writer.writeValue(std::string_view(prompt.system));
        writer.endObject();

        writer.startObject();
        writer.writeProperty("role");
        writer.writeValue(std::string_view("user"));
        writer.writeProperty("content");
        writer.writeValue(std::string_view(prompt.user));
        writer.endObject();

        writer.endArray();
        writer.writeProperty("stream");
        writer.writeValue(false);
        writer.endObject();
        return std::string(writer.view());
    }

    std::string extractReply(std::string_view response, std::string_view responsePath)
    {
        if (responsePath.empty())
        {
            return std::string(response);
        }

        json::JsonValue root;
        try
        {
            root = json::parse(response);
        }
        catch (const json::JsonError &ex)
        {
            throw GenerationError(std::string("malformed backend response: ") + ex.what());
        }

        const json::JsonValue *reply = json::resolvePath(root, responsePath);
        if (reply == nullptr || !reply->isString())
        {
            if (const json::JsonValue *error = root.find("error"))
            {
                if (error->isString())
                {
                    throw GenerationError("backend error: " + error->asString("error"));
                }
                if (const json::JsonValue *message = error->find("message"); message && message->isString())
                {
                    throw GenerationError("backend error: " + message->asString("error.message"));
                }
            }
            throw GenerationError("backend response has no string at '" + std::string(responsePath) + "'");
        }
        return reply->asString(responsePath);
    }

    std::string extractCode(std::string_view reply)
    {
        std::optional<std::string_view> block = fencedBlock(reply, "verilog");
        if (!block)
        {
            block = fencedBlock(reply, "systemverilog");
        }
        if (!block)
        {
            block = fencedBlock(reply, "");
        }
        std::string_view code = trim(block ? *block : reply);
        if (code.empty())
        {
            throw GenerationError("backend reply contains no code");
        }
        return std::string(code);
    }

    CommandGenerationClient::CommandGenerationClient(BackendCommand command, std::string model,
                                                     std::chrono::milliseconds timeout,
                                                     const proc::CancellationToken *cancel, Logger *logger)
        : command_(std::move(command)), model_(std::move(model)), timeout_(timeout), cancel_(cancel), logger_(logger)
    {
    }

    CommandGenerationClient CommandGenerationClient::fromConfig(const config::RunConfig &config,
                                                                const proc::CancellationToken *cancel,
                                                                Logger *logger)
    {
        return CommandGenerationClient(makeBackendCommand(config), config.model, config.generationTimeout, cancel,
                                       logger);
    }

    std::string CommandGenerationClient::generate(const Prompt &prompt)
    {
        const proc::ProcessSpec spec{
            .program = command_.program,
            .args = command_.args,
            .input = buildChatRequest(model_, prompt),
            .timeout = timeout_,
        };
        logTo(logger_, LogLevel::Trace, "gen", "exec " + proc::describeCommand(spec));

        const proc::ProcessResult result = proc::runProcess(spec, cancel_);
        if (result.cancelled)
        {
            throw GenerationError("generation cancelled (" + prompt.purpose + ")");
        }
        if (!result.launched)
        {
            throw GenerationError("failed to launch generation backend: " + result.launchError);
        }
        if (result.timedOut)
        {
            throw GenerationError("generation backend timed out after " + std::to_string(timeout_.count()) + "ms");
        }
        if (result.exitCode != 0)
        {
            std::string message = "generation backend exited with status " + std::to_string(result.exitCode);
            const std::string detail = tail(result.err, kStderrExcerpt);
            if (!detail.empty())
            {
                message.append(": ");
                message.append(detail);
            }
            throw GenerationError(message);
        }

        std::string reply = extractReply(result.out, command_.responsePath);
        if (trim(reply).empty())
        {
            throw GenerationError("generation backend returned an empty reply");
        }
        logTo(logger_, LogLevel::Debug, "gen",
              prompt.purpose + ": " + std::to_string(reply.size()) + " chars in " +
                  std::to_string(result.elapsed.count()) + "ms");
        return reply;
    }

    std::string ModuleGenerator::request(const Prompt &prompt)
    {
        logTo(logger_, LogLevel::Debug, "gen", "request: " + prompt.purpose);
        return extractCode(client_.generate(prompt));
    }

    Candidate ModuleGenerator::generate(const design::PlanNode &node,
                                        const std::vector<const design::VerifiedModule *> &dependencies,
                                        const std::optional<RepairContext> &repair, Candidate *partial)
    {
        Candidate candidate;
        const bool haveImplementation = repair && !repair->previousImplementation.empty();
        const bool haveHarness = repair && !repair->previousHarness.empty();
        const bool harnessImplicated = haveImplementation && haveHarness && repair->diagnosis.harnessImplicated;

        if (!haveImplementation)
        {
            candidate.implementation = request(prompts_.implementation(node, dependencies));
        }
        else if (harnessImplicated)
        {
            candidate.implementation = repair->previousImplementation;
        }
        else
        {
            candidate.implementation = request(prompts_.repairImplementation(node, *repair, dependencies));
        }
        if (partial)
        {
            partial->implementation = candidate.implementation;
        }

        if (!haveHarness || !haveImplementation)
        {
            candidate.harness = request(prompts_.harness(node, candidate.implementation));
        }
        else if (harnessImplicated)
        {
            candidate.harness = request(prompts_.repairHarness(node, *repair));
        }
        else
        {
            candidate.harness = repair->previousHarness;
        }
        if (partial)
        {
            partial->harness = candidate.harness;
        }
        return candidate;
    }

} // namespace veriloop::lib::gen
