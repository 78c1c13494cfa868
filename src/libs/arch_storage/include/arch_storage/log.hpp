#pragma once

#include <arch_storage/config.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>

namespace arch_storage {

// Shared "archstage" logger. Console sink until configure_logging() says
// otherwise.
std::shared_ptr<spdlog::logger> logger();

// Applies level and optional file sink from the config. A relative log file
// is resolved against `root`.
void configure_logging(const StoreConfig& config, const std::filesystem::path& root);

} // namespace arch_storage
