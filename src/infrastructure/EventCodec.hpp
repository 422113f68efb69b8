#pragma once

#include "domain/aggregates/ConfigState.hpp"
#include "domain/events/ConfigEventVariant.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace cre::infrastructure {

// One element of a live-log frame: the decoded event, or the error raised
// while decoding it.
struct DecodedItem {
    std::optional<domain::ConfigEventVariant> event;
    std::exception_ptr error;
};

// JSON encoding of events and state snapshots.
//
// Schema evolution: every document carries "schema_version". Documents
// without one are read as version 1, unknown fields are ignored, and a
// version newer than kSchemaVersion is rejected. New payload kinds get a
// new "event_type" value. All decode failures throw
// errors::MalformedEventError, tagged with the sequence number whenever the
// envelope was readable.
class EventCodec {
public:
    static constexpr int kSchemaVersion = 1;

    // Full envelope: header, event_type and body.
    std::string encode(const domain::ConfigEventVariant& event) const;
    nlohmann::json to_json(const domain::ConfigEventVariant& event) const;
    domain::ConfigEventVariant decode(const std::string& json_str) const;
    domain::ConfigEventVariant from_json(const nlohmann::json& obj) const;

    // A live-log frame holds one envelope or an array of them. Elements
    // decode independently, so a bad one does not take its neighbours down.
    // Invalid JSON yields a single error item.
    std::vector<DecodedItem> decode_frame(const std::string& text) const;

    // Body only, for stores that keep the header in their own columns.
    static std::string event_type(const domain::ConfigEventVariant& event);
    std::string encode_body(const domain::ConfigEventVariant& event) const;
    domain::ConfigEventVariant decode_body(const domain::ConfigEvent& header,
                                           const std::string& event_type,
                                           const std::string& body) const;

    // Snapshot payloads
    std::string encode_state(const domain::ConfigState& state) const;
    domain::ConfigState decode_state(const std::string& json_str) const;
};

} // namespace cre::infrastructure
