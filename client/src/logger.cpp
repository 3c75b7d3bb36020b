#include "robosave/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <vector>

namespace robosave::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path, bool verbose)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            if (path)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), true));
            }
            if (verbose)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            }
            if (sinks.empty())
            {
                sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
            }
            logger_ = std::make_shared<spdlog::logger>("client", sinks.begin(), sinks.end());
            logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
            logger_->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
            spdlog::set_default_logger(logger_);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "[warning] logging disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

} // namespace robosave::client
