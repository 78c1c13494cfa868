#include <arch_storage/log.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace arch_storage {

namespace {

const char* const logger_name = "archstage";
const char* const log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    auto& logger = logger_slot();
    if (logger) return logger;

    try {
        logger = spdlog::get(logger_name);
        if (!logger) logger = spdlog::stderr_color_mt(logger_name);
        logger->set_level(spdlog::level::info);
        logger->set_pattern(log_pattern);
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

void configure_logging(const StoreConfig& config, const std::filesystem::path& root) {
    auto current = logger();
    const auto level = spdlog::level::from_str(config.log_level);

    if (!config.log_file.empty()) {
        std::filesystem::path file = config.log_file;
        if (file.is_relative()) file = root / file;
        try {
            std::filesystem::create_directories(file.parent_path());
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string(), false);
            sink->set_pattern(log_pattern);
            current->sinks().push_back(sink);
            current->flush_on(spdlog::level::info);
            current->info("Logger initialized. file={}", file.string());
        } catch (const spdlog::spdlog_ex& e) {
            current->warn("log_file_unavailable file={} error={}", file.string(), e.what());
        } catch (const std::filesystem::filesystem_error& e) {
            current->warn("log_file_unavailable file={} error={}", file.string(), e.what());
        }
    }
    if (level == spdlog::level::off && config.log_level != "off") {
        current->warn("unknown log_level '{}', keeping info", config.log_level);
        return;
    }
    current->set_level(level);
}

} // namespace arch_storage
