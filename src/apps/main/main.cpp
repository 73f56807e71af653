// Graph explorer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <explorer/explorer_config.hpp>
#include <explorer/graph_explorer.hpp>
#include <graph_client/ix_http_transport.hpp>
#include <graph_loaders/snapshot_json.hpp>
#include <graph_util/log.hpp>
#include <ixwebsocket/IXNetSystem.h>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace {

void print_usage(const char* argv0) {
    (void)fprintf(stderr,
        "usage: %s [--config PATH] [--api-base URL] [--endpoint PATH] [--mode universe|issue|neo4j_default]\n"
        "          [--project ID] [--root ID] [--layout radial|column] [--limit N] [--lock-viewport]\n"
        "          [--offline] [--snapshot-file PATH] [--diagnostics] [--log-level LEVEL]\n",
        argv0);
}

// Applies command-line flags over the config file. Returns false on a bad flag.
bool parse_args(int argc, char* argv[], explorer::ExplorerConfig& config) {
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config" && i + 1 < argc) config_path = argv[i + 1];
    }
    if (!config_path.empty()) {
        std::string error;
        auto loaded = explorer::load_explorer_config_from_json_file(config_path, &error);
        if (!loaded) {
            (void)fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(), error.c_str());
            return false;
        }
        config = std::move(*loaded);
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--lock-viewport") {
            config.lock_viewport = true;
        } else if (arg == "--offline") {
            config.offline = true;
        } else if (arg == "--diagnostics") {
            config.show_diagnostics = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (!has_value) {
            (void)fprintf(stderr, "Missing value for %s\n", arg.c_str());
            return false;
        } else if (arg == "--config") {
            ++i;
        } else if (arg == "--api-base") {
            config.api_base = argv[++i];
        } else if (arg == "--endpoint") {
            config.endpoint_path = argv[++i];
        } else if (arg == "--mode") {
            if (!graph_client::parse_graph_mode(argv[++i], config.mode)) {
                (void)fprintf(stderr, "Unknown mode: %s\n", argv[i]);
                return false;
            }
        } else if (arg == "--project") {
            config.project_id = argv[++i];
        } else if (arg == "--root") {
            config.root_node_id = argv[++i];
        } else if (arg == "--layout") {
            if (!graph_layout::parse_layout_strategy(argv[++i], config.layout)) {
                (void)fprintf(stderr, "Unknown layout: %s\n", argv[i]);
                return false;
            }
        } else if (arg == "--limit") {
            const auto value = explorer::parse_int_option(argv[++i]);
            if (!value) {
                (void)fprintf(stderr, "Invalid limit: '%s'\n", argv[i]);
                return false;
            }
            config.limit = *value;
        } else if (arg == "--snapshot-file") {
            config.snapshot_file = argv[++i];
        } else if (arg == "--log-level") {
            config.log_level = argv[++i];
        } else {
            (void)fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            return false;
        }
    }
    return true;
}

std::shared_ptr<const graph_model::Snapshot> load_static_snapshot(const explorer::ExplorerConfig& config) {
    if (!config.snapshot_file.empty()) {
        std::string error;
        auto loaded = graph_loaders::load_snapshot_from_json_file(config.snapshot_file, &error);
        if (loaded) return std::make_shared<const graph_model::Snapshot>(std::move(*loaded));
        graph_util::logger()->warn("Could not load {}: {}", config.snapshot_file, error);
    }
    const char* snapshot_paths[] = { "data/example_snapshot.json", "example_snapshot.json" };
    for (const char* path : snapshot_paths) {
        auto loaded = graph_loaders::load_snapshot_from_json_file(path);
        if (loaded) return std::make_shared<const graph_model::Snapshot>(std::move(*loaded));
    }
    return std::make_shared<const graph_model::Snapshot>(graph_loaders::generate_debug_snapshot());
}

} // namespace

int main(int argc, char* argv[])
{
    explorer::ExplorerConfig config;
    if (!parse_args(argc, argv, config)) {
        print_usage(argv[0]);
        return 2;
    }
    if (!graph_util::set_log_level(config.log_level)) config.log_level = "info";
    if (!config.offline && !ix::initNetSystem()) {
        (void)fprintf(stderr, "Network initialization failed\n");
        return 1;
    }

    SDL_SetMainReady();
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    // Default fallback if display bounds are unavailable.
    int window_width = 1280;
    int window_height = 720;
    {
        SDL_Rect bounds{};
        if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &bounds)) {
            window_width = bounds.w * 3 / 4;
            window_height = bounds.h * 3 / 4;
        }
    }
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    const std::string window_title = config.title.empty() ? std::string("Graph Explorer") : config.title;
    SDL_Window* window = SDL_CreateWindow(window_title.c_str(), window_width, window_height, window_flags);
    if (!window) {
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleFonts;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleViewports;

    ImGui::StyleColorsDark();

    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
    const float font_size_px = 17.0f;
    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
    for (const char* path : font_paths) {
        if (io.Fonts->AddFontFromFileTTF(path, font_size_px, &font_cfg) != nullptr)
            break;
    }

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    std::unique_ptr<graph_client::IxHttpTransport> transport;
    if (!config.offline)
        transport = std::make_unique<graph_client::IxHttpTransport>();

    {
        explorer::GraphExplorer graph_explorer(config, transport.get());
        if (config.show_diagnostics) {
            explorer::DiagnosticsPort port;
            port.on_layout = [](const graph_layout::LayoutMap& layout, graph_layout::LayoutStrategy strategy) {
                graph_util::logger()->debug("[diagnostics] layout {} with {} nodes",
                    graph_layout::layout_strategy_name(strategy), layout.size());
            };
            port.on_view_state = [](const canvas::ViewState& view) {
                graph_util::logger()->trace("[diagnostics] view scale={:.3f} pan=({:.1f}, {:.1f})",
                    view.scale, view.pan_x, view.pan_y);
            };
            port.on_request = [](const graph_client::RequestInfo& info) {
                graph_util::logger()->debug("[diagnostics] {}", graph_client::describe(info));
            };
            graph_explorer.set_diagnostics_port(std::move(port));
        }

        if (config.offline)
            graph_explorer.show_snapshot(load_static_snapshot(config));
        else
            graph_explorer.start();

        bool running = true;
        std::uint64_t last_ticks = SDL_GetTicks();
        while (running) {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                ImGui_ImplSDL3_ProcessEvent(&event);
                if (event.type == SDL_EVENT_QUIT)
                    running = false;
                if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                    event.window.windowID == SDL_GetWindowID(window))
                    running = false;
            }

            const std::uint64_t now_ticks = SDL_GetTicks();
            const float dt = static_cast<float>(now_ticks - last_ticks) / 1000.0f;
            last_ticks = now_ticks;
            graph_explorer.update(dt);

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplSDL3_NewFrame();
            ImGui::NewFrame();

            ImGui::SetNextWindowPos(ImVec2(0, 0));
            ImGui::SetNextWindowSize(io.DisplaySize);
            ImGui::Begin("Graph Explorer", nullptr,
                ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
                | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);
            graph_explorer.draw(dt);
            ImGui::End();

            ImGui::Render();
            SDL_GL_MakeCurrent(window, gl_context);
            // HiDPI: use framebuffer size in pixels, not logical DisplaySize
            const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
            const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
            glViewport(0, 0, fb_w, fb_h);
            glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
            SDL_GL_SwapWindow(window);
        }
    }
    transport.reset();
    if (!config.offline) ix::uninitNetSystem();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
