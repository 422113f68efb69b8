#include "config/Settings.hpp"
#include "infrastructure/WebSocketLogReader.hpp"
#include "repositories/FileSystems.hpp"
#include "repositories/parquet/ParquetArchiveWriter.hpp"
#include "services/ArchiveCapture.hpp"

#include <arrow/filesystem/s3fs.h>
#include <ixwebsocket/IXNetSystem.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

static std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

// Tails one partition of the live log into the Parquet archive.
//   archive_capture [partition_key] [from_sequence]
int main(int argc, char* argv[]) {
    auto settings = cre::config::Settings::from_environment();
    if (argc >= 2) {
        settings.log.partition_key = argv[1];
    }
    const auto& partition_key = settings.log.partition_key;

    if (settings.storage.backend == "s3") {
        auto status = arrow::fs::EnsureS3Initialized();
        if (!status.ok()) {
            std::cerr << "[capture] S3 init failed: " << status.ToString() << std::endl;
            return 1;
        }
    }

    int exit_code = 0;
    {
        std::shared_ptr<arrow::fs::FileSystem> fs;
        try {
            fs = cre::repositories::make_fs(settings.storage);
        } catch (const std::exception& e) {
            std::cerr << "[capture] Storage setup failed: " << e.what() << std::endl;
            return 1;
        }

        ix::initNetSystem();

        cre::infrastructure::WebSocketLogReader reader(settings.log);
        cre::repositories::pq::ParquetArchiveWriter writer(fs, settings.storage);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        cre::services::ArchiveCapture capture(reader, writer, partition_key, settings.replication);

        // Stops the capture on SIGINT and keeps a quiet partition's buffer
        // within archive_max_age_seconds.
        std::thread watcher([&]() {
            while (running) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                try {
                    writer.flush_if_due();
                } catch (const std::exception& e) {
                    std::cerr << "[capture] Flush failed, keeping events buffered: "
                              << e.what() << std::endl;
                }
            }
            capture.stop();
        });

        try {
            std::optional<int64_t> from;
            if (argc >= 3) from = std::stoll(argv[2]);
            capture.run(from);
            std::cout << "[capture] Captured " << capture.captured() << " events into "
                      << writer.files_written() << " files" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[capture] " << e.what() << std::endl;
            exit_code = 2;
        }

        running = false;
        watcher.join();
        ix::uninitNetSystem();
    }

    if (settings.storage.backend == "s3") {
        auto status = arrow::fs::EnsureS3Finalized();
        if (!status.ok()) {
            std::cerr << "[capture] S3 finalize failed: " << status.ToString() << std::endl;
        }
    }
    return exit_code;
}
