#include "process.hpp"

#include <csignal>
#include <future>
#include <memory>
#include <system_error>
#include <utility>

#include <boost/asio.hpp>
#include <boost/filesystem.hpp>
#include <boost/process.hpp>

namespace bp = boost::process;

namespace veriloop::lib::proc
{

    namespace
    {
        using ProcessClock = std::chrono::steady_clock;

        constexpr std::chrono::milliseconds kPollInterval{20};
        constexpr std::chrono::milliseconds kDrainInterval{500};

        boost::filesystem::path resolveProgram(const std::string &program)
        {
            if (program.find('/') != std::string::npos)
            {
                boost::filesystem::path path(program);
                boost::system::error_code ec;
                return boost::filesystem::exists(path, ec) ? path : boost::filesystem::path();
            }
            return bp::search_path(program);
        }

        std::string takeFuture(std::future<std::string> &future, std::string_view stream)
        {
            if (!future.valid() || future.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
            {
                return {};
            }
            try
            {
                return future.get();
            }
            catch (const std::system_error &ex)
            {
                return std::string("[") + std::string(stream) + " unavailable: " + ex.what() + "]\n";
            }
        }

        // A child exiting before it reads stdin turns the pending write into EPIPE, not SIGPIPE.
        void ignoreBrokenPipes()
        {
            static const bool installed = []() {
                std::signal(SIGPIPE, SIG_IGN);
                return true;
            }();
            (void)installed;
        }

        template <typename... Props>
        std::unique_ptr<bp::child> spawn(const boost::filesystem::path &exe, const ProcessSpec &spec,
                                         const std::string &dir, Props &&...props)
        {
            return std::make_unique<bp::child>(exe,
                                               bp::args(spec.args),
                                               bp::start_dir = dir,
                                               std::forward<Props>(props)...);
        }
    } // namespace

    std::string ProcessResult::combinedOutput() const
    {
        std::string text = err;
        if (!text.empty() && !out.empty() && text.back() != '\n')
        {
            text.push_back('\n');
        }
        text.append(out);
        return text;
    }

    std::string describeCommand(const ProcessSpec &spec)
    {
        std::string text = spec.program;
        for (const std::string &arg : spec.args)
        {
            text.push_back(' ');
            if (arg.find(' ') != std::string::npos)
            {
                text.push_back('"');
                text.append(arg);
                text.push_back('"');
            }
            else
            {
                text.append(arg);
            }
        }
        return text;
    }

    ProcessResult runProcess(const ProcessSpec &spec, const CancellationToken *cancel)
    {
        ProcessResult result;
        const auto start = ProcessClock::now();

        if (cancel && cancel->cancelled())
        {
            result.cancelled = true;
            result.launchError = "cancelled before launch";
            return result;
        }

        const boost::filesystem::path exe = resolveProgram(spec.program);
        if (exe.empty())
        {
            result.launchError = "program not found: " + spec.program;
            return result;
        }

        if (spec.input)
        {
            ignoreBrokenPipes();
        }

        std::error_code dirError;
        const std::string dir = spec.workingDir.empty()
                                    ? std::filesystem::current_path(dirError).string()
                                    : spec.workingDir.string();

        boost::asio::io_context ios;
        std::future<std::string> outFuture;
        std::future<std::string> errFuture;
        std::future<int> exitFuture;
        bp::group group;
        std::unique_ptr<bp::child> child;

        try
        {
            if (spec.input)
            {
                child = spawn(exe, spec, dir,
                              bp::std_in < boost::asio::buffer(*spec.input),
                              bp::std_out > outFuture,
                              bp::std_err > errFuture,
                              bp::on_exit = exitFuture,
                              group,
                              ios);
            }
            else
            {
                child = spawn(exe, spec, dir,
                              bp::std_in.close(),
                              bp::std_out > outFuture,
                              bp::std_err > errFuture,
                              bp::on_exit = exitFuture,
                              group,
                              ios);
            }
        }
        catch (const bp::process_error &ex)
        {
            result.launchError = ex.what();
            return result;
        }
        result.launched = true;

        const bool bounded = spec.timeout.count() > 0;
        const auto deadline = start + spec.timeout;
        bool killed = false;
        while (!ios.stopped())
        {
            ios.run_for(kPollInterval);
            if (ios.stopped())
            {
                break;
            }
            if (cancel && cancel->cancelled())
            {
                result.cancelled = true;
                killed = true;
                break;
            }
            if (bounded && ProcessClock::now() >= deadline)
            {
                result.timedOut = true;
                killed = true;
                break;
            }
        }

        if (killed)
        {
            std::error_code ec;
            group.terminate(ec);
            if (child->running(ec))
            {
                child->terminate(ec);
            }
            // Pipes close once the group is gone; collect whatever was already written.
            ios.restart();
            ios.run_for(kDrainInterval);
        }

        result.out = takeFuture(outFuture, "stdout");
        result.err = takeFuture(errFuture, "stderr");
        if (!killed && exitFuture.valid() &&
            exitFuture.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
        {
            result.exitCode = exitFuture.get();
        }
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(ProcessClock::now() - start);
        return result;
    }

} // namespace veriloop::lib::proc
