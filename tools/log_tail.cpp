#include "config/Settings.hpp"
#include "domain/events/ConfigEventVariant.hpp"
#include "errors/ReplicationErrors.hpp"
#include "infrastructure/EventCodec.hpp"
#include "infrastructure/WebSocketLogReader.hpp"

#include <ixwebsocket/IXNetSystem.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: log_tail <partition_key> [from_sequence]" << std::endl;
        return 1;
    }

    auto settings = cre::config::Settings::from_environment();
    std::string partition_key = argv[1];

    ix::initNetSystem();

    cre::infrastructure::WebSocketLogReader reader(settings.log);
    cre::infrastructure::EventCodec codec;

    int64_t from = 0;
    try {
        from = (argc >= 3) ? std::stoll(argv[2]) : reader.oldest_available_sequence(partition_key);
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << std::endl;
        ix::uninitNetSystem();
        return 1;
    }

    std::cout << "[connected] Tailing " << reader.stream_url(partition_key, from) << std::endl;

    std::shared_ptr<cre::services::ILogSubscription> subscription =
        reader.subscribe(partition_key, from);

    std::signal(SIGINT, signal_handler);

    // next() blocks, so cancel from here once Ctrl+C lands.
    std::thread watcher([&]() {
        while (running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        subscription->cancel();
    });

    int exit_code = 0;
    while (running) {
        try {
            auto event = subscription->next();
            if (!event) break;
            std::cout << codec.encode(*event) << std::endl;
        } catch (const cre::errors::MalformedEventError& e) {
            std::cerr << "[malformed] " << e.what() << std::endl;
        } catch (const cre::errors::TransientTransportError& e) {
            std::cerr << "[disconnected] " << e.what() << std::endl;
            exit_code = 2;
            break;
        }
    }

    running = false;
    watcher.join();
    subscription.reset();
    ix::uninitNetSystem();
    std::cout << "\nDone." << std::endl;
    return exit_code;
}
