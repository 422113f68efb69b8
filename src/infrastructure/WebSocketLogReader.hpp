#pragma once

#include "config/Settings.hpp"
#include "infrastructure/EventCodec.hpp"
#include "services/ILiveLogReader.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace cre::infrastructure {

// Partitioned log service reached over HTTP (retention floor) and WebSocket
// (tailing subscriptions).
//
//   GET {http_base_url}/partitions/{key}/floor  -> {"oldest_available_sequence": N}
//   WS  {stream_url}/partitions/{key}?from=N    -> one encoded event, or an
//                                                  array of them, per message
class WebSocketLogReader : public cre::services::ILiveLogReader {
public:
    explicit WebSocketLogReader(const cre::config::LogSettings& settings);

    int64_t oldest_available_sequence(const std::string& partition_key) const override;
    std::unique_ptr<cre::services::ILogSubscription> subscribe(
        const std::string& partition_key, int64_t from_sequence_inclusive) override;

    std::string floor_url(const std::string& partition_key) const;
    std::string stream_url(const std::string& partition_key, int64_t from_sequence) const;

private:
    cre::config::LogSettings settings_;
    EventCodec codec_;
};

} // namespace cre::infrastructure
