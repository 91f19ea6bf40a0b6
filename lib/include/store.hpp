#ifndef VERILOOP_STORE_HPP
#define VERILOOP_STORE_HPP

#include "design.hpp"
#include "diagnostics.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace veriloop::lib::store
{

    enum class JsonPrintMode
    {
        Compact,
        Pretty
    };

    class StoreDiagnostics : public diag::Diagnostics
    {
    public:
        using diag::Diagnostics::Diagnostics;
        using diag::Diagnostics::error;
        using diag::Diagnostics::warning;
        using diag::Diagnostics::info;
        using diag::Diagnostics::debug;
    };

    struct StoreOptions
    {
        std::optional<std::string> outputDir;
        // Report file name (ReportStore) or design directory suffix (DesignStore).
        std::optional<std::string> outputFilename;
        JsonPrintMode jsonMode = JsonPrintMode::Pretty;
        // Fixed "YYYYMMDD_HHMMSS" prefix; the current local time when unset.
        std::optional<std::string> timestamp;
    };

    struct StoreResult
    {
        bool success = true;
        std::vector<std::string> artifacts;
    };

    class Store
    {
    public:
        explicit Store(StoreDiagnostics *diagnostics = nullptr);
        virtual ~Store() = default;

        StoreResult store(const design::DesignResult &result, const StoreOptions &options = StoreOptions());

    protected:
        StoreDiagnostics *diagnostics() const noexcept { return diagnostics_; }

        std::filesystem::path resolveOutputDir(const StoreOptions &options) const;
        bool ensureParentDirectory(const std::filesystem::path &path) const;
        std::unique_ptr<std::ofstream> openOutputFile(const std::filesystem::path &path) const;
        // Writes `text` and records the path as an artifact; false (with an error reported) on failure.
        bool writeArtifact(const std::filesystem::path &path, std::string_view text, StoreResult &result) const;

        void reportError(std::string message, std::string context = {}) const;
        void reportWarning(std::string message, std::string context = {}) const;

        virtual StoreResult storeImpl(const design::DesignResult &result, const StoreOptions &options) = 0;

    private:
        StoreDiagnostics *diagnostics_ = nullptr;
    };

    // <outputDir>/<timestamp>_<safe name>/ with design.v, testbench.v and per-module files.
    // Only Verified results are stored.
    class DesignStore : public Store
    {
    public:
        using Store::Store;

    private:
        StoreResult storeImpl(const design::DesignResult &result, const StoreOptions &options) override;
    };

    // Full DesignResult (every attempt included) as JSON.
    class ReportStore : public Store
    {
    public:
        using Store::Store;

        std::optional<std::string> storeToString(const design::DesignResult &result,
                                                 const StoreOptions &options = StoreOptions());

    private:
        StoreResult storeImpl(const design::DesignResult &result, const StoreOptions &options) override;
    };

    std::string serializeReport(const design::DesignResult &result, JsonPrintMode mode);

    // Lower-case, '_' for whitespace, other punctuation dropped, at most 40 characters.
    std::string safeName(std::string_view text);
    std::string currentTimestamp();

    // Line-based unified diff; empty when the texts are identical.
    std::string unifiedDiff(std::string_view before, std::string_view after,
                            std::string_view fromLabel = "previous", std::string_view toLabel = "current",
                            std::size_t context = 3);

} // namespace veriloop::lib::store

#endif // VERILOOP_STORE_HPP
