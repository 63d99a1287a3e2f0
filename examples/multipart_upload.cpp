/**
 * @file multipart_upload.cpp
 * @brief Command-line multipart upload into a local object store
 *
 * USAGE:
 * mpu-upload <bucket> <file> [--key K] [--root DIR] [--part-size N]
 *            [--concurrency N] [--config FILE] [--log-level L]
 *            [--digest md5|sha256]
 *
 * The object key defaults to the file name. The bucket is a directory under
 * --root (default: current directory) and is created if missing.
 *
 * OUTPUT:
 * Logs go to stderr. Exactly one JSON line goes to stdout:
 *   {"status":"completed","bucket":"b","key":"k","etag":"...","size":123}
 *   {"status":"failed","error_kind":"PartIntegrityError","message":"...",...}
 *
 * EXIT CODES:
 * 0 completed, 2 usage/invalid input, 3 I/O, 4 store, 5 part integrity,
 * 6 completion integrity, 130 cancelled (SIGINT)
 */

#include "mpu/config/config.hpp"
#include "mpu/core/cancellation.hpp"
#include "mpu/events/components.hpp"
#include "mpu/events/event_bus.hpp"
#include "mpu/store/local_store.hpp"
#include "mpu/upload/coordinator.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace mpu;
using json = nlohmann::json;

namespace {

constexpr int kExitUsage = 2;

std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted.store(true);
    }
}

struct CommandLine {
    std::string bucket;
    std::filesystem::path file;
    std::optional<std::string> key;
    std::filesystem::path root = ".";
    std::optional<std::uint64_t> part_size;
    std::optional<std::size_t> concurrency;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> log_level;
    std::optional<std::string> digest;
};

void print_usage(const char* program) {
    std::cerr << "usage: " << program
              << " <bucket> <file> [--key K] [--root DIR] [--part-size N] [--concurrency N]"
                 " [--config FILE] [--log-level L] [--digest md5|sha256]\n";
}

Result<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cli;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            positional.push_back(arg);
            continue;
        }
        if (i + 1 >= argc) {
            return Err("missing value for " + arg);
        }
        const std::string value = argv[++i];
        try {
            if (arg == "--key") {
                cli.key = value;
            } else if (arg == "--root") {
                cli.root = value;
            } else if (arg == "--part-size") {
                cli.part_size = std::stoull(value);
            } else if (arg == "--concurrency") {
                cli.concurrency = static_cast<std::size_t>(std::stoul(value));
            } else if (arg == "--config") {
                cli.config_path = value;
            } else if (arg == "--log-level") {
                cli.log_level = value;
            } else if (arg == "--digest") {
                cli.digest = value;
            } else {
                return Err("unknown option " + arg);
            }
        } catch (const std::logic_error&) {
            return Err("invalid number for " + arg + ": " + value);
        }
    }

    if (positional.size() != 2) {
        return Err(std::string("expected <bucket> and <file>"));
    }
    cli.bucket = positional[0];
    cli.file = positional[1];
    return Ok(std::move(cli));
}

/// File values first, then command-line overrides, then validation.
Result<config::UploaderConfig, UploadError> build_config(const CommandLine& cli) {
    config::UploaderConfig cfg;
    if (cli.config_path) {
        auto loaded = config::load_config(*cli.config_path);
        if (loaded.is_error()) {
            return Err(loaded.error());
        }
        cfg = loaded.value();
    }

    if (cli.part_size) {
        cfg.part_size = *cli.part_size;
    }
    if (cli.concurrency) {
        cfg.concurrency = *cli.concurrency;
    }
    if (cli.log_level) {
        cfg.log_level = *cli.log_level;
    }
    if (cli.digest) {
        auto algorithm = config::parse_digest_algorithm(*cli.digest);
        if (!algorithm) {
            return Err(UploadError::invalid_argument("unknown digest algorithm: " + *cli.digest));
        }
        cfg.digest_algorithm = *algorithm;
    }

    if (auto valid = cfg.validate(); valid.is_error()) {
        return Err(valid.error());
    }
    return Ok(std::move(cfg));
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidSize:
        case ErrorKind::EmptyFile:
        case ErrorKind::InvalidArgument:
            return kExitUsage;
        case ErrorKind::Io:
            return 3;
        case ErrorKind::Store:
            return 4;
        case ErrorKind::PartIntegrity:
            return 5;
        case ErrorKind::CompletionIntegrity:
            return 6;
        case ErrorKind::Cancelled:
            return 130;
    }
    return 1;
}

json failure_json(const UploadError& error) {
    json out = {
        {"status", "failed"},
        {"error_kind", to_string(error.kind)},
        {"message", error.message}
    };
    if (error.part_index) {
        out["part_index"] = *error.part_index;
    }
    if (!error.expected.empty()) {
        out["expected"] = error.expected;
    }
    if (!error.observed.empty()) {
        out["observed"] = error.observed;
    }
    return out;
}

int report_failure(const UploadError& error) {
    std::cout << failure_json(error).dump() << std::endl;
    return exit_code_for(error.kind);
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("mpu"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto parsed = parse_command_line(argc, argv);
    if (parsed.is_error()) {
        print_usage(argv[0]);
        return report_failure(UploadError::invalid_argument(parsed.error()));
    }
    const CommandLine cli = parsed.value();

    auto cfg_result = build_config(cli);
    if (cfg_result.is_error()) {
        return report_failure(cfg_result.error());
    }
    const config::UploaderConfig cfg = cfg_result.value();
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    const std::string key = cli.key.value_or(cli.file.filename().string());

    store::LocalObjectStore object_store(cli.root, cfg.digest_algorithm,
                                         cfg.limits.value_or(upload::PartLimits{}));
    if (auto created = object_store.create_bucket(cli.bucket); created.is_error()) {
        return report_failure(UploadError::store(created.error()));
    }

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    std::signal(SIGINT, signal_handler);

    CancellationToken cancel;
    std::atomic<bool> finished{false};
    std::thread watcher([&]() {
        while (!finished.load()) {
            if (g_interrupted.load()) {
                spdlog::info("Received SIGINT, cancelling upload...");
                cancel.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    upload::UploadCoordinator coordinator(object_store, bus, cfg.to_coordinator_options());
    auto result = coordinator.upload(cli.file, cli.bucket, key, cancel);

    finished.store(true);
    watcher.join();

    metrics.print_stats();

    if (result.is_error()) {
        return report_failure(result.error());
    }

    const auto& record = result.value();
    json out = {
        {"status", "completed"},
        {"bucket", record.bucket},
        {"key", record.key},
        {"etag", record.final_etag},
        {"size", record.total_size_bytes}
    };
    std::cout << out.dump() << std::endl;
    return 0;
}
