#include <graph_util/log.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <vector>

namespace graph_util {

namespace {

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance;
    if (instance) return instance;

    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "graph_explorer_latest.log";
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true));
        instance = std::make_shared<spdlog::logger>("graph_explorer", sinks.begin(), sinks.end());
        instance->set_level(spdlog::level::info);
        instance->flush_on(spdlog::level::info);
        instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        instance->debug("Logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex&) {
        instance = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        instance = spdlog::default_logger();
    }
    return instance;
}

bool set_log_level(const std::string& level_name) {
    const spdlog::level::level_enum level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && level_name != "off") {
        logger()->warn("Unknown log level '{}', keeping {}", level_name,
            spdlog::level::to_string_view(logger()->level()));
        return false;
    }
    logger()->set_level(level);
    return true;
}

} // namespace graph_util
