#ifndef VERILOOP_DIAGNOSTICS_HPP
#define VERILOOP_DIAGNOSTICS_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace veriloop::lib::diag
{

    enum class DiagnosticKind
    {
        Error,
        Warning,
        Info,
        Debug
    };

    struct Diagnostic
    {
        DiagnosticKind kind = DiagnosticKind::Error;
        std::string message;
        std::string context;
        // Stage that produced the message (config, plan, store, ...).
        std::string origin;
        // Plan node the message refers to, if any.
        std::string node;
    };

    const char *diagnosticKindText(DiagnosticKind kind) noexcept;

    class Diagnostics
    {
    public:
        explicit Diagnostics(std::string origin = {}) : origin_(std::move(origin)) {}

        Diagnostics(const Diagnostics &) = delete;
        Diagnostics &operator=(const Diagnostics &) = delete;

        void error(std::string message, std::string context = {}, std::string node = {});
        void warning(std::string message, std::string context = {}, std::string node = {});
        void info(std::string message, std::string context = {}, std::string node = {});
        void debug(std::string message, std::string context = {}, std::string node = {});

        void setOnError(std::function<void()> callback) { onError_ = std::move(callback); }
        std::vector<Diagnostic> messages() const;
        bool empty() const;
        bool hasError() const noexcept { return hasError_.load(std::memory_order_relaxed); }
        const std::string &origin() const noexcept { return origin_; }
        void clear();

    protected:
        void add(DiagnosticKind kind, std::string message, std::string context, std::string node);

    private:
        std::string origin_;
        std::vector<Diagnostic> messages_;
        std::atomic<bool> hasError_{false};
        std::function<void()> onError_;
        mutable std::mutex mutex_;
    };

} // namespace veriloop::lib::diag

#endif // VERILOOP_DIAGNOSTICS_HPP
