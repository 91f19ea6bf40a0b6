#ifndef VERILOOP_CLASSIFY_HPP
#define VERILOOP_CLASSIFY_HPP

#include "design.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace veriloop::lib::classify
{

    enum class Phase
    {
        Compile,
        Simulation
    };

    inline constexpr std::size_t kUnknownEvidenceLimit = 8 * 1024;
    inline constexpr std::size_t kEvidenceLimit = 2 * 1024;
    inline constexpr std::size_t kContextLines = 2;
    inline constexpr std::size_t kFailingLineLimit = 8;

    // Maps raw compiler / simulator text onto a FailureCategory plus the smallest excerpt worth
    // putting into a repair prompt. Stateless.
    class DiagnosticClassifier
    {
    public:
        explicit DiagnosticClassifier(design::MarkerSet markers = {}) : markers_(std::move(markers)) {}

        design::Diagnosis classify(std::string_view raw, Phase phase) const;

        // Timeout and ToolUnavailable map without looking at the text.
        design::Diagnosis classify(const design::VerificationOutcome &outcome) const;

    private:
        design::Diagnosis classifyCompile(std::string_view raw) const;
        design::Diagnosis classifySimulation(std::string_view raw) const;

        design::MarkerSet markers_;
    };

    // Raw text kept verbatim, trimmed from the front to the last `limit` bytes.
    std::string tailCapped(std::string_view raw, std::size_t limit = kUnknownEvidenceLimit);

} // namespace veriloop::lib::classify

#endif // VERILOOP_CLASSIFY_HPP
