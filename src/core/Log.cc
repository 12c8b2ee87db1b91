#include "vault/core/Log.hh"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <filesystem>
#include <string>
#include <vector>

namespace vault::log {

namespace {
quill::Logger* g_logger = nullptr;
quill::Logger* g_logger_session = nullptr;

const std::string kLogsDir = "logs";

std::shared_ptr<quill::Sink> makeFileSink(const std::string& filename) {
    return quill::Frontend::create_or_get_sink<quill::FileSink>(filename, []() {
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('w');
        cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
        return cfg;
    }());
}

quill::PatternFormatterOptions makePattern() {
    quill::PatternFormatterOptions pattern;
    pattern.format_pattern = "%(time) [%(thread_id)] %(short_source_location:<28) "
                             "%(log_level:<9) %(message)";
    pattern.timestamp_pattern = "%H:%M:%S.%Qms";
    return pattern;
}

void startBackend() {
    quill::BackendOptions backend_opts;
    backend_opts.thread_name = "VaultLog";
    backend_opts.wait_for_queues_to_empty_before_exit = true;
    quill::Backend::start(backend_opts);
}

void createLoggers(const std::vector<std::shared_ptr<quill::Sink>>& extraSinks) {
    std::filesystem::create_directories(kLogsDir);

    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    auto vault_file = makeFileSink(kLogsDir + "/vault.log");
    auto session_file = makeFileSink(kLogsDir + "/session.log");

    std::vector<std::shared_ptr<quill::Sink>> rootSinks{console_sink, vault_file};
    std::vector<std::shared_ptr<quill::Sink>> sessionSinks{console_sink, session_file};
    rootSinks.insert(rootSinks.end(), extraSinks.begin(), extraSinks.end());
    sessionSinks.insert(sessionSinks.end(), extraSinks.begin(), extraSinks.end());

    // Root logger: console + vault.log
    g_logger = quill::Frontend::create_or_get_logger("vault", std::move(rootSinks), makePattern());
    g_logger->set_log_level(quill::LogLevel::Info);

    // Session logger: console + session.log
    g_logger_session = quill::Frontend::create_or_get_logger("session", std::move(sessionSinks), makePattern());
    g_logger_session->set_log_level(quill::LogLevel::Info);
}

} // namespace

void init() {
    startBackend();
    createLoggers({});
}

void init(const char* log_file_path) {
    startBackend();
    createLoggers({makeFileSink(log_file_path)});
}

void shutdown() {
    for (auto* lg : {g_logger, g_logger_session}) {
        if (lg)
            lg->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* logger() {
    return g_logger;
}

quill::Logger* sessionLogger() {
    return g_logger_session;
}

void setLevel(quill::LogLevel level) {
    if (g_logger) {
        g_logger->set_log_level(level);
    }
}

} // namespace vault::log
