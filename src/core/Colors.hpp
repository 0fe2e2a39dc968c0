#pragma once

#include <array>
#include <raylib-cpp.hpp>

#include "Constants.hpp"

namespace asteroids {

inline constexpr ::Color ship_color{255, 161, 0, constants::alpha_opaque};
inline constexpr ::Color projectile_color{230, 41, 55, constants::alpha_opaque};

// Grey meteor shades, one per asteroid variant; indices wrap.
inline auto asteroid_color(int variant) -> raylib::Color {
    static constexpr std::array<::Color, 4> shades{{{150, 150, 150, constants::alpha_opaque},
                                                    {130, 126, 120, constants::alpha_opaque},
                                                    {170, 165, 160, constants::alpha_opaque},
                                                    {112, 112, 118, constants::alpha_opaque}}};
    const auto n = static_cast<int>(shades.size());
    return shades[static_cast<size_t>(((variant % n) + n) % n)];
}

}  // namespace asteroids
