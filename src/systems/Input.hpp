#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <raylib.h>

#include "../core/Config.hpp"

namespace asteroids {

enum class Action : std::uint8_t { forward, turn_left, turn_right, fire };
inline constexpr size_t action_count = 4;

// Logical input the ship controller reads each tick.
class InputSource {
public:
    virtual ~InputSource() = default;
    [[nodiscard]] virtual bool is_held(Action action) const = 0;
    // True only on the tick the action went from released to pressed.
    [[nodiscard]] virtual bool was_just_pressed(Action action) const = 0;
};

// Keyboard input through raylib, using the bindings in Config.
class RaylibInput final : public InputSource {
public:
    explicit RaylibInput(const Config& cfg) { rebind(cfg); }

    void rebind(const Config& cfg) {
        keys_ = {cfg.key_forward, cfg.key_turn_left, cfg.key_turn_right, cfg.key_fire};
    }

    [[nodiscard]] bool is_held(const Action action) const override { return IsKeyDown(key(action)); }
    [[nodiscard]] bool was_just_pressed(const Action action) const override { return IsKeyPressed(key(action)); }

private:
    [[nodiscard]] int key(const Action action) const { return keys_[static_cast<size_t>(action)]; }

    std::array<int, action_count> keys_{};
};

}  // namespace asteroids
