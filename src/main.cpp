#include "config/Settings.hpp"
#include "infrastructure/WebSocketLogReader.hpp"
#include "repositories/BlobSnapshotStore.hpp"
#include "repositories/FileSystems.hpp"
#include "repositories/parquet/ParquetArchiveReader.hpp"
#include "services/ReplicationEngine.hpp"
#include "services/SnapshotScheduler.hpp"

#include <arrow/filesystem/s3fs.h>
#include <ixwebsocket/IXNetSystem.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

static std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

int main(int argc, char* argv[]) {
    auto settings = cre::config::Settings::from_environment();

    // Optional CLI arg: partition key
    if (argc >= 2) {
        settings.log.partition_key = argv[1];
    }

    struct S3Guard {
        S3Guard() {
            auto status = arrow::fs::EnsureS3Initialized();
            if (!status.ok()) {
                std::cerr << "[engine] S3 init failed: " << status.ToString() << std::endl;
            }
        }
        ~S3Guard() {
            auto status = arrow::fs::EnsureS3Finalized();
            if (!status.ok()) {
                std::cerr << "[engine] S3 finalize failed: " << status.ToString() << std::endl;
            }
        }
    };
    std::unique_ptr<S3Guard> s3_guard;
    if (settings.storage.backend == "s3") {
        s3_guard = std::make_unique<S3Guard>();
    }

    std::shared_ptr<arrow::fs::FileSystem> fs;
    try {
        fs = cre::repositories::make_fs(settings.storage);
    } catch (const std::exception& e) {
        std::cerr << "[engine] Storage setup failed: " << e.what() << std::endl;
        return 1;
    }

    ix::initNetSystem();

    cre::repositories::BlobSnapshotStore snapshots(fs, settings.storage.snapshot_prefix);
    cre::repositories::pq::ParquetArchiveReader archive(fs, settings.storage.archive_prefix);
    cre::infrastructure::WebSocketLogReader live_log(settings.log);

    cre::services::ReplicationEngine engine(snapshots, archive, live_log,
                                            settings.log.partition_key, settings.replication);
    cre::services::SnapshotScheduler scheduler(engine, snapshots,
                                               settings.log.partition_key, settings.snapshot);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // start() blocks through archive catch-up; let SIGINT abort it.
    std::thread stop_watch([&]() {
        while (running && engine.phase() != cre::services::EnginePhase::LiveStreaming
               && engine.healthy() && engine.phase() != cre::services::EnginePhase::Stopped) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        if (!running) engine.stop();
    });

    try {
        engine.start();
    } catch (const std::exception& e) {
        std::cerr << "[engine] Startup failed: " << e.what() << std::endl;
        running = false;
        stop_watch.join();
        ix::uninitNetSystem();
        return 2;
    }
    stop_watch.join();

    if (!running) {
        ix::uninitNetSystem();
        return 0;
    }

    scheduler.start();
    std::cout << "[engine] Started partition '" << settings.log.partition_key << "' at #"
              << engine.next_sequence_number() << std::endl;

    // Stats loop
    uint64_t last_event_count = engine.events_applied();
    auto last_stats_time = std::chrono::steady_clock::now();

    while (running) {
        for (int i = 0; i < 10 && running; ++i) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        if (!running) break;

        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - last_stats_time).count();
        uint64_t current_events = engine.events_applied();
        double events_per_sec = (elapsed > 0) ? (current_events - last_event_count) / elapsed : 0;
        auto state = engine.current_state();

        std::cout << "[stats] phase=" << cre::services::to_string(engine.phase())
                  << " as_of=#" << state->get_as_of_sequence_number()
                  << " markups=" << state->markup_count()
                  << " brands=" << state->brand_count()
                  << " events/sec=" << static_cast<int>(events_per_sec)
                  << " duplicates=" << engine.duplicates_skipped()
                  << " reconnects=" << engine.reconnect_count()
                  << " snapshot=#" << scheduler.last_written_sequence()
                  << std::endl;

        if (!engine.healthy()) {
            std::cerr << "[engine] Unhealthy: " << engine.last_error() << std::endl;
            break;
        }

        last_event_count = current_events;
        last_stats_time = now;
    }

    engine.stop();
    scheduler.stop();
    ix::uninitNetSystem();

    std::cout << "\n[engine] Done. Applied " << engine.events_applied() << " events." << std::endl;
    return engine.healthy() ? 0 : 3;
}
