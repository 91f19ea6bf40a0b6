#include "diagnostics.hpp"

#include <utility>

namespace veriloop::lib::diag
{

    const char *diagnosticKindText(DiagnosticKind kind) noexcept
    {
        switch (kind)
        {
        case DiagnosticKind::Error:
            return "error";
        case DiagnosticKind::Warning:
            return "warn";
        case DiagnosticKind::Info:
            return "info";
        case DiagnosticKind::Debug:
        default:
            return "debug";
        }
    }

    void Diagnostics::error(std::string message, std::string context, std::string node)
    {
        add(DiagnosticKind::Error, std::move(message), std::move(context), std::move(node));
    }

    void Diagnostics::warning(std::string message, std::string context, std::string node)
    {
        add(DiagnosticKind::Warning, std::move(message), std::move(context), std::move(node));
    }

    void Diagnostics::info(std::string message, std::string context, std::string node)
    {
        add(DiagnosticKind::Info, std::move(message), std::move(context), std::move(node));
    }

    void Diagnostics::debug(std::string message, std::string context, std::string node)
    {
        add(DiagnosticKind::Debug, std::move(message), std::move(context), std::move(node));
    }

    std::vector<Diagnostic> Diagnostics::messages() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    bool Diagnostics::empty() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.empty();
    }

    void Diagnostics::clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.clear();
        hasError_.store(false, std::memory_order_relaxed);
    }

    void Diagnostics::add(DiagnosticKind kind, std::string message, std::string context, std::string node)
    {
        const bool isError = kind == DiagnosticKind::Error;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(Diagnostic{
                .kind = kind,
                .message = std::move(message),
                .context = std::move(context),
                .origin = origin_,
                .node = std::move(node),
            });
        }

        if (isError)
        {
            hasError_.store(true, std::memory_order_relaxed);
            if (onError_)
            {
                onError_();
            }
        }
    }

} // namespace veriloop::lib::diag
