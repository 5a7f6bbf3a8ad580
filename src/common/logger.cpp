// =============================================================================
// chipscan - Logger Module Implementation
// =============================================================================

#include "chipscan/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace chipscan::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Serializes init() and shutdown().
std::mutex gLifecycleMutex;

[[nodiscard]] std::shared_ptr<quill::Sink> makeStderrSink() {
    quill::ConsoleSinkConfig consoleConfig;
    consoleConfig.set_stream("stderr");
    return quill::Frontend::create_or_get_sink<quill::ConsoleSink>("chipscan-stderr",
                                                                   consoleConfig);
}

[[nodiscard]] std::shared_ptr<quill::Sink> makeFileSink(const std::string& path) {
    quill::FileSinkConfig fileConfig;
    fileConfig.set_open_mode('w');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(path, fileConfig,
                                                                quill::FileEventNotifier{});
}

}  // namespace

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Warning;
}

std::string_view levelToString(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return "trace";
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarning:
            return "warning";
        case Level::kError:
            return "error";
        case Level::kCritical:
            return "critical";
    }
    return "warning";
}

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (config.enableStderr || config.logFile.empty()) {
        sinks.push_back(makeStderrSink());
    }
    if (!config.logFile.empty()) {
        sinks.push_back(makeFileSink(config.logFile));
    }

    quill::Logger* created =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace chipscan::log
