#include "common/logger.hpp"

// plog
#include <plog/Appenders/ColorConsoleAppender.h>
#include <plog/Formatters/FuncMessageFormatter.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <plog/Logger.h>

#include <iostream>
#include <memory>
#include <mutex>

namespace jinglesdp {
namespace logging {
namespace {

class LogAppender : public plog::IAppender {
public:
    void set_callback(LoggingCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    void write(const plog::Record& record) override {
        const auto severity = record.getSeverity();
        auto formatted = plog::FuncMessageFormatter::format(record);
        formatted.pop_back(); // remove newline

        // Invoked outside the lock, the callback may log itself.
        LoggingCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = callback_;
        }
        if (!callback || !callback(static_cast<Level>(severity), formatted)) {
            std::cout << plog::severityToString(severity) << " " << formatted << std::endl;
        }
    }

private:
    std::mutex mutex_;
    LoggingCallback callback_;
};

void InitLogger(plog::Severity severity, plog::IAppender* appender) {
    static plog::ColorConsoleAppender<plog::TxtFormatter> console_appender;
    static plog::Logger<PLOG_DEFAULT_INSTANCE_ID>* logger = nullptr;
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    if (!logger) {
        logger = &plog::init(severity, appender ? appender : &console_appender);
        PLOG_DEBUG << "Logger initialized";
    } else {
        logger->setMaxSeverity(severity);
        if (appender) {
            logger->addAppender(appender);
        }
    }
}

} // namespace

void InitLogger(Level level, LoggingCallback callback) {
    static std::unique_ptr<LogAppender> appender;
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    const auto severity = static_cast<plog::Severity>(level);
    if (appender) {
        appender->set_callback(std::move(callback));
        InitLogger(severity, nullptr); // change the severity
    } else if (callback) {
        appender = std::make_unique<LogAppender>();
        appender->set_callback(std::move(callback));
        InitLogger(severity, appender.get());
    } else {
        InitLogger(severity, nullptr); // log to console
    }
}

} // namespace logging
} // namespace jinglesdp
