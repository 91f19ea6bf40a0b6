#ifndef VERILOOP_GENERATION_HPP
#define VERILOOP_GENERATION_HPP

#include "config.hpp"
#include "design.hpp"
#include "logging.hpp"
#include "process.hpp"
#include "prompts.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace veriloop::lib::gen
{

    // Backend could not produce usable text: launch failure, non-zero exit, timeout,
    // malformed response or an empty reply.
    class GenerationError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class GenerationClient
    {
    public:
        virtual ~GenerationClient() = default;

        // Returns the raw reply text; throws GenerationError.
        virtual std::string generate(const Prompt &prompt) = 0;
    };

    struct BackendCommand
    {
        std::string program;
        std::vector<std::string> args;
        // Field path of the reply inside a JSON response; empty means stdout is the reply.
        std::string responsePath;
    };

    // Builds the backend invocation for the configured provider. ollama and openai go through
    // curl; command runs generator_exec as given. Throws GenerationError when a required
    // credential is missing.
    BackendCommand makeBackendCommand(const config::RunConfig &config);

    // {"model", "messages": [system, user], "stream": false}
    std::string buildChatRequest(std::string_view model, const Prompt &prompt);

    // Pulls the reply text out of a backend response.
    std::string extractReply(std::string_view response, std::string_view responsePath);

    // First ```verilog, ```systemverilog or bare ``` fenced block, else the trimmed reply.
    // Throws GenerationError when nothing is left.
    std::string extractCode(std::string_view reply);

    class CommandGenerationClient : public GenerationClient
    {
    public:
        CommandGenerationClient(BackendCommand command, std::string model, std::chrono::milliseconds timeout,
                                const proc::CancellationToken *cancel = nullptr, Logger *logger = nullptr);

        static CommandGenerationClient fromConfig(const config::RunConfig &config,
                                                  const proc::CancellationToken *cancel = nullptr,
                                                  Logger *logger = nullptr);

        std::string generate(const Prompt &prompt) override;

        const BackendCommand &command() const noexcept { return command_; }

    private:
        BackendCommand command_;
        std::string model_;
        std::chrono::milliseconds timeout_;
        const proc::CancellationToken *cancel_;
        Logger *logger_;
    };

    struct Candidate
    {
        std::string implementation;
        std::string harness;
    };

    // Turns a node (plus repair context) into an implementation and a harness. A repair rewrites
    // the file the diagnosis points at and carries the other one forward.
    class ModuleGenerator
    {
    public:
        ModuleGenerator(GenerationClient &client, const PromptBuilder &prompts, Logger *logger = nullptr)
            : client_(client), prompts_(prompts), logger_(logger)
        {
        }

        // `partial` receives whatever was produced before a GenerationError is thrown.
        Candidate generate(const design::PlanNode &node,
                           const std::vector<const design::VerifiedModule *> &dependencies,
                           const std::optional<RepairContext> &repair,
                           Candidate *partial = nullptr);

    private:
        std::string request(const Prompt &prompt);

        GenerationClient &client_;
        const PromptBuilder &prompts_;
        Logger *logger_;
    };

} // namespace veriloop::lib::gen

#endif // VERILOOP_GENERATION_HPP
