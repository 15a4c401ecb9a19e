//
// Config.hpp
//

#ifndef SETRUSH_CONFIG_HPP
#define SETRUSH_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include "Types.hpp"

namespace setrush::core
{
    // Everything a launcher needs: the game settings plus the front end's own knobs.
    struct LaunchOptions
    {
        Config game{};
        std::uint16_t port{9002};
        std::chrono::milliseconds seat_wait{std::chrono::seconds(30)};
        std::string audit_path{};
    };

    // Parses "--flag value" pairs (program name excluded). Unknown flags, missing values and
    // malformed numbers throw ConfigError. The result is validated.
    auto ParseArgs(std::span<std::string_view const> args) -> LaunchOptions;
    auto ParseArgs(int argc, char** argv) -> LaunchOptions;

    // Throws ConfigError on settings the game cannot run with.
    auto Validate(Config const& cfg) -> void;

    auto Usage() -> std::string_view;
}

#endif //SETRUSH_CONFIG_HPP
