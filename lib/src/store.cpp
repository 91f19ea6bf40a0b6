#include "store.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <exception>
#include <set>
#include <system_error>
#include <utility>

#include "slang/text/Json.h"

namespace veriloop::lib::store
{

    namespace
    {

        constexpr std::size_t kSafeNameLimit = 40;

        std::vector<std::string_view> splitLines(std::string_view text)
        {
            std::vector<std::string_view> lines;
            std::size_t start = 0;
            while (start < text.size())
            {
                const std::size_t end = text.find('\n', start);
                if (end == std::string_view::npos)
                {
                    lines.push_back(text.substr(start));
                    break;
                }
                lines.push_back(text.substr(start, end - start));
                start = end + 1;
            }
            return lines;
        }

        void writeString(slang::JsonWriter &writer, std::string_view key, std::string_view value)
        {
            writer.writeProperty(key);
            writer.writeValue(value);
        }

        void writeStringArray(slang::JsonWriter &writer, std::string_view key, const std::vector<std::string> &values)
        {
            writer.writeProperty(key);
            writer.startArray();
            for (const std::string &value : values)
            {
                writer.writeValue(std::string_view(value));
            }
            writer.endArray();
        }

        void writePorts(slang::JsonWriter &writer, std::string_view key, const std::vector<design::Port> &ports)
        {
            writer.writeProperty(key);
            writer.startArray();
            for (const design::Port &port : ports)
            {
                writer.startObject();
                writeString(writer, "name", port.name);
                writeString(writer, "direction", design::toString(port.direction));
                writer.writeProperty("width");
                writer.writeValue(static_cast<int64_t>(port.width));
                writer.endObject();
            }
            writer.endArray();
        }

        void writeDiagnosis(slang::JsonWriter &writer, const design::Diagnosis &diagnosis)
        {
            writer.startObject();
            writeString(writer, "category", design::toString(diagnosis.category));
            writeString(writer, "evidence", diagnosis.evidence);
            if (!diagnosis.file.empty())
            {
                writeString(writer, "file", diagnosis.file);
                writer.writeProperty("line");
                writer.writeValue(static_cast<int64_t>(diagnosis.line));
            }
            writer.writeProperty("harnessImplicated");
            writer.writeValue(diagnosis.harnessImplicated);
            writer.endObject();
        }

        void writeAttempt(slang::JsonWriter &writer, const design::Attempt &attempt)
        {
            writer.startObject();
            writer.writeProperty("index");
            writer.writeValue(static_cast<uint64_t>(attempt.index));
            writeString(writer, "outcome", design::toString(attempt.outcome.kind));
            writeString(writer, "diagnostic", attempt.outcome.diagnostic);
            if (!attempt.outcome.failingVectors.empty())
            {
                writeStringArray(writer, "failingVectors", attempt.outcome.failingVectors);
            }
            if (attempt.diagnosis)
            {
                writer.writeProperty("diagnosis");
                writeDiagnosis(writer, *attempt.diagnosis);
            }
            writeString(writer, "implementation", attempt.implementation);
            writeString(writer, "harness", attempt.harness);
            writer.endObject();
        }

        void writeModule(slang::JsonWriter &writer, const design::ModuleResult &module)
        {
            writer.startObject();
            writeString(writer, "name", module.node);
            writeString(writer, "status", design::toString(module.status));
            if (!module.reason.empty())
            {
                writeString(writer, "reason", module.reason);
            }
            if (!module.lastDiagnostic.empty())
            {
                writeString(writer, "lastDiagnostic", module.lastDiagnostic);
            }
            if (module.verified)
            {
                writePorts(writer, "interface", module.verified->interface);
                writeStringArray(writer, "dependencies", module.verified->dependencies);
            }
            writer.writeProperty("attempts");
            writer.startArray();
            for (const design::Attempt &attempt : module.attempts)
            {
                writeAttempt(writer, attempt);
            }
            writer.endArray();
            writer.endObject();
        }

        // Above this many table cells the changed middle is emitted as one replacement.
        constexpr std::size_t kDiffCellLimit = 4'000'000;

        // Longest-common-subsequence edit script: ' ', '-' or '+' per line. The common prefix
        // and suffix are matched directly.
        std::vector<std::pair<char, std::string_view>> editScript(const std::vector<std::string_view> &a,
                                                                  const std::vector<std::string_view> &b)
        {
            std::size_t prefix = 0;
            while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix])
            {
                ++prefix;
            }
            std::size_t suffix = 0;
            while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
                   a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix])
            {
                ++suffix;
            }

            std::vector<std::pair<char, std::string_view>> script;
            for (std::size_t k = 0; k < prefix; ++k)
            {
                script.emplace_back(' ', a[k]);
            }

            const std::size_t aEnd = a.size() - suffix;
            const std::size_t bEnd = b.size() - suffix;
            const std::size_t n = aEnd - prefix;
            const std::size_t m = bEnd - prefix;
            if (n != 0 && m != 0 && (n + 1) * (m + 1) > kDiffCellLimit)
            {
                for (std::size_t k = prefix; k < aEnd; ++k)
                {
                    script.emplace_back('-', a[k]);
                }
                for (std::size_t k = prefix; k < bEnd; ++k)
                {
                    script.emplace_back('+', b[k]);
                }
            }
            else
            {
                std::vector<std::vector<uint32_t>> lcs(n + 1, std::vector<uint32_t>(m + 1, 0));
                for (std::size_t i = n; i-- > 0;)
                {
                    for (std::size_t j = m; j-- > 0;)
                    {
                        lcs[i][j] = a[prefix + i] == b[prefix + j] ? lcs[i + 1][j + 1] + 1
                                                                   : std::max(lcs[i + 1][j], lcs[i][j + 1]);
                    }
                }

                std::size_t i = 0;
                std::size_t j = 0;
                while (i < n && j < m)
                {
                    if (a[prefix + i] == b[prefix + j])
                    {
                        script.emplace_back(' ', a[prefix + i]);
                        ++i;
                        ++j;
                    }
                    else if (lcs[i + 1][j] >= lcs[i][j + 1])
                    {
                        script.emplace_back('-', a[prefix + i++]);
                    }
                    else
                    {
                        script.emplace_back('+', b[prefix + j++]);
                    }
                }
                while (i < n)
                {
                    script.emplace_back('-', a[prefix + i++]);
                }
                while (j < m)
                {
                    script.emplace_back('+', b[prefix + j++]);
                }
            }

            for (std::size_t k = aEnd; k < a.size(); ++k)
            {
                script.emplace_back(' ', a[k]);
            }
            return script;
        }

        std::string hunkRange(std::size_t start, std::size_t count)
        {
            // Empty ranges name the line before the hunk.
            const std::size_t first = count == 0 ? start : start + 1;
            if (count == 1)
            {
                return std::to_string(first);
            }
            return std::to_string(first) + "," + std::to_string(count);
        }

    } // namespace

    std::string safeName(std::string_view text)
    {
        std::string out;
        bool pendingSeparator = false;
        for (char c : text)
        {
            const unsigned char uc = static_cast<unsigned char>(c);
            if (std::isalnum(uc))
            {
                if (pendingSeparator && !out.empty())
                {
                    out.push_back('_');
                }
                pendingSeparator = false;
                out.push_back(static_cast<char>(std::tolower(uc)));
            }
            else if (std::isspace(uc) || c == '_' || c == '-')
            {
                pendingSeparator = true;
            }
            if (out.size() >= kSafeNameLimit)
            {
                break;
            }
        }
        if (out.size() > kSafeNameLimit)
        {
            out.resize(kSafeNameLimit);
        }
        return out.empty() ? std::string("design") : out;
    }

    std::string currentTimestamp()
    {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);
        char buf[32];
        const std::size_t len = std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &local);
        return std::string(buf, len);
    }

    std::string serializeReport(const design::DesignResult &result, JsonPrintMode mode)
    {
        slang::JsonWriter writer;
        writer.setPrettyPrint(mode == JsonPrintMode::Pretty);
        writer.startObject();
        writeString(writer, "status", design::toString(result.status));
        writeString(writer, "top", result.top);
        if (!result.reason.empty())
        {
            writeString(writer, "reason", result.reason);
        }
        writeStringArray(writer, "failed", result.failedNodes);
        writeStringArray(writer, "skipped", result.skippedNodes);

        writer.writeProperty("modules");
        writer.startArray();
        for (const design::ModuleResult &module : result.modules)
        {
            writeModule(writer, module);
        }
        writer.endArray();

        if (result.status == design::DesignStatus::Verified)
        {
            writeString(writer, "integratedDesign", result.integratedDesign);
        }
        writer.endObject();
        return std::string(writer.view());
    }

    std::string unifiedDiff(std::string_view before, std::string_view after, std::string_view fromLabel,
                            std::string_view toLabel, std::size_t context)
    {
        if (before == after)
        {
            return {};
        }
        const std::vector<std::string_view> a = splitLines(before);
        const std::vector<std::string_view> b = splitLines(after);
        const std::vector<std::pair<char, std::string_view>> script = editScript(a, b);

        std::string out;
        out.append("--- ").append(fromLabel).append("\n");
        out.append("+++ ").append(toLabel).append("\n");

        std::vector<std::size_t> changes;
        for (std::size_t k = 0; k < script.size(); ++k)
        {
            if (script[k].first != ' ')
            {
                changes.push_back(k);
            }
        }

        std::size_t next = 0;
        while (next < changes.size())
        {
            // Changes separated by at most 2 * context unchanged lines share a hunk.
            std::size_t last = next;
            while (last + 1 < changes.size() && changes[last + 1] - changes[last] - 1 <= 2 * context)
            {
                ++last;
            }
            const std::size_t begin = changes[next] > context ? changes[next] - context : 0;
            const std::size_t end = std::min(script.size(), changes[last] + 1 + context);

            std::size_t oldStart = 0;
            std::size_t newStart = 0;
            for (std::size_t k = 0; k < begin; ++k)
            {
                oldStart += script[k].first != '+' ? 1 : 0;
                newStart += script[k].first != '-' ? 1 : 0;
            }
            std::size_t oldCount = 0;
            std::size_t newCount = 0;
            std::string body;
            for (std::size_t k = begin; k < end; ++k)
            {
                oldCount += script[k].first != '+' ? 1 : 0;
                newCount += script[k].first != '-' ? 1 : 0;
                body.push_back(script[k].first);
                body.append(script[k].second);
                body.push_back('\n');
            }
            out.append("@@ -").append(hunkRange(oldStart, oldCount));
            out.append(" +").append(hunkRange(newStart, newCount)).append(" @@\n");
            out.append(body);
            next = last + 1;
        }
        return out;
    }

    Store::Store(StoreDiagnostics *diagnostics) : diagnostics_(diagnostics) {}

    void Store::reportError(std::string message, std::string context) const
    {
        if (diagnostics_ != nullptr)
        {
            diagnostics_->error(std::move(message), std::move(context));
        }
    }

    void Store::reportWarning(std::string message, std::string context) const
    {
        if (diagnostics_ != nullptr)
        {
            diagnostics_->warning(std::move(message), std::move(context));
        }
    }

    std::filesystem::path Store::resolveOutputDir(const StoreOptions &options) const
    {
        if (options.outputDir && !options.outputDir->empty())
        {
            return std::filesystem::path(*options.outputDir);
        }
        return std::filesystem::current_path();
    }

    bool Store::ensureParentDirectory(const std::filesystem::path &path) const
    {
        const std::filesystem::path parent = path.parent_path();
        if (parent.empty())
        {
            return true;
        }

        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            reportError("Failed to create output directory: " + ec.message(), parent.string());
            return false;
        }
        return true;
    }

    std::unique_ptr<std::ofstream> Store::openOutputFile(const std::filesystem::path &path) const
    {
        if (!ensureParentDirectory(path))
        {
            return nullptr;
        }

        auto stream = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::trunc);
        if (!stream->is_open())
        {
            reportError("Failed to open output file for writing", path.string());
            return nullptr;
        }
        return stream;
    }

    bool Store::writeArtifact(const std::filesystem::path &path, std::string_view text, StoreResult &result) const
    {
        auto stream = openOutputFile(path);
        if (!stream)
        {
            result.success = false;
            return false;
        }
        *stream << text;
        if (!text.empty() && text.back() != '\n')
        {
            *stream << '\n';
        }
        stream->flush();
        if (!*stream)
        {
            reportError("Failed to write output file", path.string());
            result.success = false;
            return false;
        }
        result.artifacts.push_back(path.string());
        return true;
    }

    StoreResult Store::store(const design::DesignResult &designResult, const StoreOptions &options)
    {
        StoreResult result = storeImpl(designResult, options);
        if (diagnostics_ && diagnostics_->hasError())
        {
            result.success = false;
        }
        return result;
    }

    StoreResult DesignStore::storeImpl(const design::DesignResult &designResult, const StoreOptions &options)
    {
        StoreResult result;
        if (designResult.status != design::DesignStatus::Verified)
        {
            reportError("Only verified designs are stored", design::toString(designResult.status));
            result.success = false;
            return result;
        }

        const std::string stem = options.timestamp.value_or(currentTimestamp()) + "_" +
                                 safeName(options.outputFilename.value_or(designResult.top));
        const std::filesystem::path root = resolveOutputDir(options);
        std::filesystem::path dir = root / stem;
        std::error_code ec;
        for (uint32_t suffix = 2; std::filesystem::exists(dir, ec); ++suffix)
        {
            dir = root / (stem + "_" + std::to_string(suffix));
        }

        if (!writeArtifact(dir / "design.v", designResult.integratedDesign, result))
        {
            return result;
        }

        const design::ModuleResult *top = designResult.find(designResult.top);
        if (top != nullptr && top->verified)
        {
            if (!writeArtifact(dir / "testbench.v", top->verified->harness, result))
            {
                return result;
            }
        }
        else
        {
            reportWarning("Top module has no verified harness; testbench.v not written", designResult.top);
        }

        std::set<std::string> written{"design", "testbench"};
        for (const design::ModuleResult &module : designResult.modules)
        {
            if (!module.verified)
            {
                continue;
            }
            if (!written.insert(module.node).second || !written.insert("tb_" + module.node).second)
            {
                reportWarning("Module file name collides with another artifact; skipped", module.node);
                continue;
            }
            if (!writeArtifact(dir / (module.node + ".v"), module.verified->implementation, result) ||
                !writeArtifact(dir / ("tb_" + module.node + ".v"), module.verified->harness, result))
            {
                return result;
            }
        }
        return result;
    }

    std::optional<std::string> ReportStore::storeToString(const design::DesignResult &designResult,
                                                          const StoreOptions &options)
    {
        try
        {
            return serializeReport(designResult, options.jsonMode);
        }
        catch (const std::exception &ex)
        {
            reportError("Failed to serialize report to JSON: " + std::string(ex.what()));
            return std::nullopt;
        }
    }

    StoreResult ReportStore::storeImpl(const design::DesignResult &designResult, const StoreOptions &options)
    {
        StoreResult result;
        const std::optional<std::string> text = storeToString(designResult, options);
        if (!text)
        {
            result.success = false;
            return result;
        }

        const std::string filename = options.outputFilename.value_or(std::string("report.json"));
        const std::filesystem::path outputPath = resolveOutputDir(options) / filename;
        writeArtifact(outputPath, *text, result);
        return result;
    }

} // namespace veriloop::lib::store
