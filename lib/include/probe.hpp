#ifndef VERILOOP_PROBE_HPP
#define VERILOOP_PROBE_HPP

#include "design.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace veriloop::lib::probe
{

    struct InterfaceReadResult
    {
        // Set when the front end elaborated `top` without errors.
        std::optional<std::vector<design::Port>> ports;
        // Why no port list could be read.
        std::string error;
    };

    // Elaborates `files` with slang using `top` as the top module and reads its port list.
    InterfaceReadResult readInterface(std::string_view top, const std::vector<std::filesystem::path> &files);

    // Ports are matched by name; order is not significant. Returns one line per difference, or
    // nullopt when the interfaces agree.
    std::optional<std::string> describeMismatch(std::string_view module,
                                                const std::vector<design::Port> &expected,
                                                const std::vector<design::Port> &actual);

} // namespace veriloop::lib::probe

#endif // VERILOOP_PROBE_HPP
