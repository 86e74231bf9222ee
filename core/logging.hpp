#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

namespace house::core
{
    // Console sink plus an optional file sink, at the current global level.
    // The logger is not registered globally, so several instances of a module can coexist.
    auto create_logger(std::string const& name, std::optional<std::filesystem::path> const& log_path)
        -> std::shared_ptr<spdlog::logger>;
} // namespace house::core
