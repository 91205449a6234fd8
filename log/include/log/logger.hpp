#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    class Logger
    {
      public:
        static constexpr char const* loggerName = "remote_dispatch";

        Logger()
            : guard_{}
            , logger_{std::make_shared<spdlog::logger>(
                  loggerName,
                  std::make_shared<spdlog::sinks::stderr_color_sink_mt>())}
        {
            logger_->set_level(spdlog::level::info);
        }

        /**
         * @brief Adds a file sink. Messages keep going to stderr as well.
         * A file that already has a sink is not added again.
         *
         * @param path The log file, appended to if it exists.
         * @return false if the file already had a sink.
         */
        bool addFileSink(std::filesystem::path const& path)
        {
            std::error_code ec;
            auto key = std::filesystem::weakly_canonical(path, ec);
            if (ec)
                key = std::filesystem::absolute(path).lexically_normal();

            std::scoped_lock lock{guard_};
            if (!fileSinkPaths_.insert(key).second)
                return false;
            logger_->sinks().push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false));
            return true;
        }

        void setLevel(Log::Level level)
        {
            std::scoped_lock lock{guard_};
            logger_->set_level(toSpdlogLevel(level));
        }

        Log::Level level() const
        {
            return fromSpdlogLevel(logger_->level());
        }

        void flush()
        {
            std::scoped_lock lock{guard_};
            logger_->flush();
        }

        template <typename... Args>
        void log(Log::Level level, std::string_view fmt, Args&&... args)
        {
            if (!logger_->should_log(toSpdlogLevel(level)))
                return;

            const std::string buf = spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...);
            logImpl(level, buf);
        }

        void logImpl(Log::Level level, std::string const& msg)
        {
            std::scoped_lock lock{guard_};
            logger_->log(toSpdlogLevel(level), msg);
        }

      private:
        std::recursive_mutex guard_;
        std::shared_ptr<spdlog::logger> logger_;
        std::set<std::filesystem::path> fileSinkPaths_{};
    };
}
