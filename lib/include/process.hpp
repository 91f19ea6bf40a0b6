#ifndef VERILOOP_PROCESS_HPP
#define VERILOOP_PROCESS_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace veriloop::lib::proc
{

    // Shared stop flag for every subprocess launched on behalf of one run. Once set it stays set.
    class CancellationToken
    {
    public:
        void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
        bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    private:
        std::atomic<bool> cancelled_{false};
    };

    struct ProcessSpec
    {
        // Looked up on PATH unless it contains a path separator.
        std::string program;
        std::vector<std::string> args;
        std::filesystem::path workingDir;
        // Written to stdin, which is then closed; stdin is closed immediately when unset.
        std::optional<std::string> input;
        // Zero disables the limit.
        std::chrono::milliseconds timeout{0};
    };

    struct ProcessResult
    {
        bool launched = false;
        bool timedOut = false;
        bool cancelled = false;
        int exitCode = -1;
        std::string out;
        std::string err;
        std::string launchError;
        std::chrono::milliseconds elapsed{0};

        bool succeeded() const noexcept { return launched && !timedOut && !cancelled && exitCode == 0; }
        // stderr followed by stdout, the order compilers report in.
        std::string combinedOutput() const;
    };

    // Runs one subprocess to completion. Timeout and cancellation kill the whole process group
    // (SIGKILL); launch failures are reported through ProcessResult::launched.
    ProcessResult runProcess(const ProcessSpec &spec, const CancellationToken *cancel = nullptr);

    std::string describeCommand(const ProcessSpec &spec);

} // namespace veriloop::lib::proc

#endif // VERILOOP_PROCESS_HPP
