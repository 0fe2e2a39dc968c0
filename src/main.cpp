#include <flecs.h>
#include <imgui.h>
#include <raylib-cpp.hpp>
#include <raylib.h>
#include <rlImGui.h>

#include "components/Components.hpp"
#include "core/Config.hpp"
#include "core/Constants.hpp"

#include "systems/Camera.hpp"
#include "systems/Control.hpp"
#include "systems/Input.hpp"
#include "systems/Simulation.hpp"
#include "systems/Spawner.hpp"
#include "systems/UI.hpp"
#include "systems/WorldRenderer.hpp"

class Application {
public:
    Application() : input_(Config{}) {
        SetConfigFlags(FLAG_WINDOW_HIGHDPI | FLAG_MSAA_4X_HINT);
        InitWindow(asteroids::constants::window_width, asteroids::constants::window_height, "Asteroids");
        SetTargetFPS(asteroids::constants::target_fps);
        rlImGuiSetup(true);

        initialize_world();
    }

    ~Application() {
        rlImGuiShutdown();
        CloseWindow();
    }

    void run() {
        while (!WindowShouldClose()) {
            update();
            render();
        }
    }

private:
    flecs::world world_;
    asteroids::RaylibInput input_;

    void initialize_world() {
        asteroids::Simulation::init(world_);
        asteroids::Simulation::register_systems(world_);
        if (const auto* cfg = world_.get<Config>()) input_.rebind(*cfg);
    }

    void update() {
        const double frameStart = GetTime();

        raylib::Camera2D* camera = asteroids::Camera::get(world_);
        auto* cfg = world_.get_mut<Config>();
        if (cfg == nullptr || camera == nullptr) return;

        asteroids::UI::begin();
        asteroids::UI::draw(world_);

        const ImGuiIO& imguiIO = ImGui::GetIO();
        if (!imguiIO.WantCaptureMouse) {
            if (const float wheel = GetMouseWheelMove(); wheel != 0.0F) asteroids::Camera::zoom_at_mouse(*camera, wheel);
        }

        if (!cfg->paused) {
            const float frameDt = GetFrameTime();
            const float dt = asteroids::Simulation::effective_dt(*cfg, frameDt);

            // Ship input is read outside the pipeline so it lands before integration this frame.
            if (!imguiIO.WantCaptureKeyboard) {
                asteroids::systems::WorldSpawner spawner(world_);
                asteroids::systems::Control::process_input(world_, input_, spawner, dt);
            }
            [[maybe_unused]] auto progress = world_.progress(cfg->use_fixed_dt ? cfg->fixed_dt : frameDt);
        }

        constexpr double kMsPerSec = 1000.0;
        cfg->last_step_ms = (GetTime() - frameStart) * kMsPerSec;
    }

    void render() {
        BeginDrawing();
        ClearBackground(asteroids::constants::background);

        raylib::Camera2D* camera = asteroids::Camera::get(world_);
        if (camera != nullptr) {
            if (const auto* cfg = world_.get<Config>()) {
                asteroids::systems::WorldRenderer::render_scene(world_, *cfg, *camera);
            }
        }
        asteroids::systems::WorldRenderer::render_hud(world_);

        asteroids::UI::end();
        EndDrawing();
    }
};

auto main() -> int {
    try {
        Application app;
        app.run();
        return 0;
    } catch (const std::exception& e) {
        TraceLog(LOG_ERROR, "Exception: %s", e.what());
        return 1;
    }
}
