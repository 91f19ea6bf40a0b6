#ifndef VERILOOP_TESTS_SCRIPTED_BACKENDS_HPP
#define VERILOOP_TESTS_SCRIPTED_BACKENDS_HPP

#include "design.hpp"
#include "generation.hpp"
#include "prompts.hpp"
#include "verify.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace veriloop::tests
{

    // Answers "decompose" with `plan` and every other prompt with a fenced module whose text
    // names the prompt purpose. `failures[purpose]` GenerationErrors are thrown first.
    class ScriptedClient : public lib::gen::GenerationClient
    {
    public:
        std::string generate(const lib::gen::Prompt &prompt) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            purposes.push_back(prompt.purpose);
            users.push_back(prompt.user);
            if (prompt.purpose == "decompose")
            {
                return plan;
            }
            auto it = failures.find(prompt.purpose);
            if (it != failures.end() && it->second > 0)
            {
                --it->second;
                throw lib::gen::GenerationError("backend unreachable");
            }
            const std::string name = prompt.purpose.substr(prompt.purpose.find(' ') + 1);
            const bool harness = prompt.purpose.rfind("harness", 0) == 0 || prompt.purpose.rfind("repair-harness", 0) == 0;
            return "```verilog\nmodule " + std::string(harness ? "tb_" : "") + name + "; // " +
                   std::to_string(++counter_) + " " + prompt.purpose + "\nendmodule\n```";
        }

        std::vector<std::string> purposesSnapshot() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return purposes;
        }

        std::string plan;
        std::map<std::string, int> failures;
        std::vector<std::string> purposes;
        std::vector<std::string> users;

    private:
        mutable std::mutex mutex_;
        int counter_ = 0;
    };

    // Replays scripted outcomes per module; the last scripted outcome repeats, an unscripted
    // module passes.
    class ScriptedRunner : public lib::verify::VerificationRunner
    {
    public:
        lib::design::VerificationOutcome verify(const lib::verify::VerificationJob &job) override
        {
            std::chrono::milliseconds delay{0};
            lib::design::VerificationOutcome outcome =
                lib::design::VerificationOutcome::makePassed("VLP_PASS v0\nVLP_DONE\n");
            {
                std::lock_guard<std::mutex> lock(mutex_);
                jobs.push_back(job);
                delay = this->delay;
                auto it = script.find(job.module);
                if (it != script.end() && !it->second.empty())
                {
                    outcome = it->second.front();
                    if (it->second.size() > 1)
                    {
                        it->second.erase(it->second.begin());
                    }
                }
            }
            // Busy until the delay passes or the run is cancelled.
            const auto until = std::chrono::steady_clock::now() + delay;
            while (std::chrono::steady_clock::now() < until)
            {
                if (job.cancel && job.cancel->cancelled())
                {
                    return lib::design::VerificationOutcome::makeTimeout("simulation cancelled");
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return outcome;
        }

        std::vector<lib::verify::VerificationJob> jobsSnapshot() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return jobs;
        }

        std::map<std::string, std::vector<lib::design::VerificationOutcome>> script;
        std::vector<lib::verify::VerificationJob> jobs;
        std::chrono::milliseconds delay{0};

    private:
        mutable std::mutex mutex_;
    };

} // namespace veriloop::tests

#endif // VERILOOP_TESTS_SCRIPTED_BACKENDS_HPP
