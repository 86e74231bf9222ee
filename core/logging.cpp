#include "logging.hpp"
#include "precompiled.hpp"

namespace house::core
{
    auto create_logger(std::string const& name, std::optional<std::filesystem::path> const& log_path)
        -> std::shared_ptr<spdlog::logger>
    {
        std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
        if (log_path)
        {
            auto const file_path = std::filesystem::path(log_path.value()).make_preferred();
            sinks.emplace_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path.string()));
        }
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(spdlog::get_level());
        return logger;
    }
} // namespace house::core
