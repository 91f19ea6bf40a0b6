#include "classify.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <optional>
#include <vector>

namespace veriloop::lib::classify
{

    namespace
    {

        using design::Diagnosis;
        using design::FailureCategory;

        struct Pattern
        {
            FailureCategory category;
            std::string_view needle;
        };

        // Checked in order; needles are lower case. Phrases follow Icarus Verilog and slang.
        constexpr std::array kCompilePatterns{
            Pattern{FailureCategory::PortMismatch, "port mismatch"},
            Pattern{FailureCategory::PortMismatch, "is not a port"},
            Pattern{FailureCategory::PortMismatch, "too many ports"},
            Pattern{FailureCategory::PortMismatch, "port count"},
            Pattern{FailureCategory::PortMismatch, "wrong number of ports"},
            Pattern{FailureCategory::PortMismatch, "bits, got"},
            Pattern{FailureCategory::PortMismatch, " expects "},
            Pattern{FailureCategory::PortMismatch, "port width"},
            Pattern{FailureCategory::PortMismatch, "port direction"},
            Pattern{FailureCategory::UnresolvedReference, "unknown module type"},
            Pattern{FailureCategory::UnresolvedReference, "unable to bind"},
            Pattern{FailureCategory::UnresolvedReference, "not declared"},
            Pattern{FailureCategory::UnresolvedReference, "undeclared"},
            Pattern{FailureCategory::UnresolvedReference, "unknown identifier"},
            Pattern{FailureCategory::UnresolvedReference, "is not defined"},
            Pattern{FailureCategory::UnresolvedReference, "cannot be found"},
            Pattern{FailureCategory::SyntaxError, "syntax error"},
            Pattern{FailureCategory::SyntaxError, "parse error"},
            Pattern{FailureCategory::SyntaxError, "malformed"},
            Pattern{FailureCategory::SyntaxError, "invalid module item"},
            Pattern{FailureCategory::SyntaxError, "expected"},
        };

        struct Location
        {
            std::string file;
            int64_t line = 0;
        };

        std::vector<std::string_view> splitLines(std::string_view text)
        {
            std::vector<std::string_view> lines;
            std::size_t start = 0;
            while (start < text.size())
            {
                std::size_t end = text.find('\n', start);
                if (end == std::string_view::npos)
                {
                    end = text.size();
                }
                std::string_view line = text.substr(start, end - start);
                if (!line.empty() && line.back() == '\r')
                {
                    line.remove_suffix(1);
                }
                lines.push_back(line);
                start = end + 1;
            }
            return lines;
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

        bool startsWith(std::string_view text, std::string_view prefix)
        {
            return text.substr(0, prefix.size()) == prefix;
        }

        // "<file>:<line>:" at the start of `line` (after an optional "ERROR: " style prefix).
        std::optional<Location> parseLocation(std::string_view line)
        {
            for (std::string_view prefix : {"ERROR: ", "FATAL: ", "error: "})
            {
                if (startsWith(line, prefix))
                {
                    line.remove_prefix(prefix.size());
                    break;
                }
            }
            const std::size_t colon = line.find(':');
            if (colon == std::string_view::npos || colon == 0)
            {
                return std::nullopt;
            }
            std::string_view file = line.substr(0, colon);
            if (file.find(' ') != std::string_view::npos)
            {
                return std::nullopt;
            }
            std::string_view rest = line.substr(colon + 1);
            int64_t number = 0;
            auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), number);
            if (ec != std::errc() || ptr == rest.data() || ptr == rest.data() + rest.size() || *ptr != ':')
            {
                return std::nullopt;
            }
            return Location{std::string(file), number};
        }

        bool isWarningLine(std::string_view line)
        {
            const std::string lower = lowered(line);
            return lower.find("warning") != std::string::npos && lower.find("error") == std::string::npos;
        }

        // Icarus continues a message on "<file>:<line>:        : ..." lines.
        bool isContinuationLine(std::string_view line)
        {
            const std::size_t first = line.find(':');
            const std::size_t second = first == std::string_view::npos ? first : line.find(':', first + 1);
            if (second == std::string_view::npos)
            {
                return false;
            }
            const std::size_t body = line.find_first_not_of(' ', second + 1);
            return body != std::string_view::npos && line[body] == ':';
        }

        std::string capped(std::string text, std::size_t limit)
        {
            if (text.size() > limit)
            {
                text.resize(limit);
                text.append("\n...");
            }
            return text;
        }

        std::string joinLines(const std::vector<std::string_view> &lines, std::size_t first, std::size_t count)
        {
            std::string out;
            for (std::size_t i = first; i < lines.size() && i < first + count; ++i)
            {
                if (!out.empty())
                {
                    out.push_back('\n');
                }
                out.append(lines[i]);
            }
            return out;
        }

        std::optional<FailureCategory> matchCategory(std::string_view text)
        {
            const std::string lower = lowered(text);
            for (const Pattern &pattern : kCompilePatterns)
            {
                if (lower.find(pattern.needle) != std::string::npos)
                {
                    return pattern.category;
                }
            }
            return std::nullopt;
        }

        bool isHarnessFile(std::string_view file)
        {
            const std::size_t slash = file.find_last_of('/');
            if (slash != std::string_view::npos)
            {
                file.remove_prefix(slash + 1);
            }
            return startsWith(file, "tb_");
        }

        Diagnosis unknown(std::string_view raw)
        {
            Diagnosis diagnosis;
            diagnosis.category = FailureCategory::Unknown;
            diagnosis.evidence = tailCapped(raw);
            return diagnosis;
        }

    } // namespace

    std::string tailCapped(std::string_view raw, std::size_t limit)
    {
        if (raw.size() <= limit)
        {
            return std::string(raw);
        }
        return std::string(raw.substr(raw.size() - limit));
    }

    Diagnosis DiagnosticClassifier::classify(std::string_view raw, Phase phase) const
    {
        return phase == Phase::Compile ? classifyCompile(raw) : classifySimulation(raw);
    }

    Diagnosis DiagnosticClassifier::classify(const design::VerificationOutcome &outcome) const
    {
        switch (outcome.kind)
        {
        case design::OutcomeKind::CompileError:
            return classifyCompile(outcome.diagnostic);
        case design::OutcomeKind::LogicError:
        {
            if (outcome.failingVectors.empty())
            {
                return classifySimulation(outcome.diagnostic);
            }
            Diagnosis diagnosis;
            diagnosis.category = FailureCategory::AssertionFailure;
            std::vector<std::string_view> lines(outcome.failingVectors.begin(), outcome.failingVectors.end());
            diagnosis.evidence = capped(joinLines(lines, 0, kFailingLineLimit), kEvidenceLimit);
            if (lines.size() > kFailingLineLimit)
            {
                diagnosis.evidence.append("\n(" + std::to_string(lines.size() - kFailingLineLimit) +
                                          " more failing vectors)");
            }
            return diagnosis;
        }
        case design::OutcomeKind::Timeout:
        {
            Diagnosis diagnosis;
            diagnosis.category = FailureCategory::Timeout;
            diagnosis.evidence = tailCapped(outcome.diagnostic, kEvidenceLimit);
            return diagnosis;
        }
        case design::OutcomeKind::ToolUnavailable:
            return unknown(outcome.diagnostic);
        case design::OutcomeKind::Passed:
        default:
            return unknown({});
        }
    }

    Diagnosis DiagnosticClassifier::classifyCompile(std::string_view raw) const
    {
        const std::vector<std::string_view> lines = splitLines(raw);

        // First located line that is not a plain warning.
        std::optional<std::size_t> errorIndex;
        std::optional<Location> location;
        for (std::size_t i = 0; i < lines.size(); ++i)
        {
            auto loc = parseLocation(lines[i]);
            if (loc && !isWarningLine(lines[i]) && !isContinuationLine(lines[i]))
            {
                errorIndex = i;
                location = std::move(loc);
                break;
            }
        }

        std::optional<FailureCategory> category;
        if (errorIndex)
        {
            category = matchCategory(joinLines(lines, *errorIndex, kContextLines + 1));
        }
        if (!category)
        {
            category = matchCategory(raw);
        }
        if (!category)
        {
            return unknown(raw);
        }

        Diagnosis diagnosis;
        diagnosis.category = *category;
        if (errorIndex)
        {
            diagnosis.evidence = capped(joinLines(lines, *errorIndex, kContextLines + 1), kEvidenceLimit);
            diagnosis.file = location->file;
            diagnosis.line = location->line;
            diagnosis.harnessImplicated = isHarnessFile(location->file);
        }
        else
        {
            // Category found, but no located line; quote the first matching line.
            for (std::size_t i = 0; i < lines.size(); ++i)
            {
                if (matchCategory(lines[i]) == category)
                {
                    diagnosis.evidence = capped(joinLines(lines, i, kContextLines + 1), kEvidenceLimit);
                    break;
                }
            }
        }
        return diagnosis;
    }

    Diagnosis DiagnosticClassifier::classifySimulation(std::string_view raw) const
    {
        const std::vector<std::string_view> lines = splitLines(raw);
        std::vector<std::string_view> failing;
        std::optional<Location> location;
        for (std::string_view line : lines)
        {
            const bool marker = !markers_.fail.empty() && line.find(markers_.fail) != std::string_view::npos;
            const bool fatal = startsWith(line, "ERROR:") || startsWith(line, "FATAL:");
            if (!marker && !fatal)
            {
                continue;
            }
            if (!location)
            {
                location = parseLocation(line);
            }
            failing.push_back(line);
        }
        if (failing.empty())
        {
            return unknown(raw);
        }

        Diagnosis diagnosis;
        diagnosis.category = FailureCategory::AssertionFailure;
        diagnosis.evidence = capped(joinLines(failing, 0, kFailingLineLimit), kEvidenceLimit);
        if (failing.size() > kFailingLineLimit)
        {
            diagnosis.evidence.append("\n(" + std::to_string(failing.size() - kFailingLineLimit) +
                                      " more failing vectors)");
        }
        if (location)
        {
            diagnosis.file = location->file;
            diagnosis.line = location->line;
        }
        return diagnosis;
    }

} // namespace veriloop::lib::classify
