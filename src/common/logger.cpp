// =============================================================================
// parz - Logging Implementation
// =============================================================================

#include "parz/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace parz::log {

namespace {

constexpr const char* kLoggerName = "parz";

std::atomic<quill::Logger*> gLogger{nullptr};
std::mutex gLifecycleMutex;

quill::LogLevel quillLevel(Level level) noexcept {
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
    }
    return quill::LogLevel::Info;
}

std::shared_ptr<quill::Sink> makeFileSink(const std::string& path) {
    quill::FileSinkConfig sinkConfig;
    sinkConfig.set_open_mode('w');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(path, sinkConfig,
                                                                quill::FileEventNotifier{});
}

}  // namespace

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    if (!config.logFile.empty()) {
        sinks.push_back(makeFileSink(config.logFile));
    }

    quill::Logger* created = quill::Frontend::create_or_get_logger(kLoggerName, std::move(sinks));
    created->set_log_level(quillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
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

}  // namespace parz::log
