#include "infrastructure/EventCodec.hpp"

#include "errors/ReplicationErrors.hpp"

#include <optional>
#include <type_traits>
#include <variant>

using json = nlohmann::json;
using namespace cre::domain;

namespace cre::infrastructure {

namespace {

constexpr const char* kMarkupUpdate = "markup_update";
constexpr const char* kBrandUpdate = "brand_update";
constexpr const char* kSetDefaultMarkup = "set_default_markup";

void check_schema_version(const json& obj, std::optional<int64_t> seq) {
    int version = 1;
    try {
        version = obj.value("schema_version", 1);
    } catch (const json::exception& e) {
        throw errors::MalformedEventError(e.what(), seq);
    }
    if (version < 1 || version > EventCodec::kSchemaVersion) {
        throw errors::MalformedEventError(
            "unsupported schema_version " + std::to_string(version), seq);
    }
}

json body_of(const MarkupUpdate& e) {
    return json{{"category", e.category}, {"price", e.price.value()}};
}

json body_of(const BrandUpdate& e) {
    return json{{"code", e.code.value()}, {"name", e.name}};
}

json body_of(const SetDefaultMarkup& e) {
    return json{{"price", e.price.value()}};
}

ConfigEventVariant parse_body(const ConfigEvent& header, const std::string& event_type,
                              const json& body) {
    if (!body.is_object()) {
        throw errors::MalformedEventError("body is not an object", header.sequence_number);
    }

    try {
        if (event_type == kMarkupUpdate) {
            return MarkupUpdate{header,
                                body.at("category").get<std::string>(),
                                MarkupRate(body.at("price").get<double>())};
        }
        if (event_type == kBrandUpdate) {
            return BrandUpdate{header,
                               BrandCode(body.at("code").get<std::string>()),
                               body.value("name", "")};
        }
        if (event_type == kSetDefaultMarkup) {
            return SetDefaultMarkup{header, MarkupRate(body.at("price").get<double>())};
        }
    } catch (const json::exception& e) {
        throw errors::MalformedEventError(event_type + ": " + e.what(), header.sequence_number);
    } catch (const std::invalid_argument& e) {
        throw errors::MalformedEventError(event_type + ": " + e.what(), header.sequence_number);
    } catch (const std::out_of_range& e) {
        throw errors::MalformedEventError(event_type + ": " + e.what(), header.sequence_number);
    }

    throw errors::MalformedEventError("unknown event_type '" + event_type + "'",
                                      header.sequence_number);
}

json parse_document(const std::string& json_str) {
    auto obj = json::parse(json_str, nullptr, false);
    if (obj.is_discarded()) {
        throw errors::MalformedEventError("invalid JSON");
    }
    return obj;
}

} // anonymous namespace

std::string EventCodec::event_type(const ConfigEventVariant& event) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, MarkupUpdate>) {
            return kMarkupUpdate;
        } else if constexpr (std::is_same_v<T, BrandUpdate>) {
            return kBrandUpdate;
        } else {
            return kSetDefaultMarkup;
        }
    }, event);
}

json EventCodec::to_json(const ConfigEventVariant& event) const {
    return std::visit([](const auto& e) {
        return json{
            {"schema_version", kSchemaVersion},
            {"partition_key", e.partition_key},
            {"sequence_number", e.sequence_number},
            {"enqueued_at_ms", e.enqueued_at.milliseconds()},
            {"event_type", EventCodec::event_type(e)},
            {"body", body_of(e)},
        };
    }, event);
}

std::string EventCodec::encode(const ConfigEventVariant& event) const {
    return to_json(event).dump();
}

ConfigEventVariant EventCodec::decode(const std::string& json_str) const {
    return from_json(parse_document(json_str));
}

ConfigEventVariant EventCodec::from_json(const json& obj) const {
    if (!obj.is_object()) {
        throw errors::MalformedEventError("event is not an object");
    }

    std::optional<int64_t> seq;
    auto seq_it = obj.find("sequence_number");
    if (seq_it != obj.end() && seq_it->is_number_integer()) {
        seq = seq_it->get<int64_t>();
    }

    check_schema_version(obj, seq);

    if (!seq || *seq < 0) {
        throw errors::MalformedEventError("missing or negative sequence_number", seq);
    }

    try {
        ConfigEvent header{
            obj.at("partition_key").get<std::string>(),
            *seq,
            Timestamp(obj.value("enqueued_at_ms", int64_t{0})),
        };
        return parse_body(header, obj.at("event_type").get<std::string>(), obj.at("body"));
    } catch (const json::exception& e) {
        throw errors::MalformedEventError(e.what(), seq);
    } catch (const std::out_of_range& e) {
        throw errors::MalformedEventError(e.what(), seq);
    }
}

std::vector<DecodedItem> EventCodec::decode_frame(const std::string& text) const {
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return {DecodedItem{std::nullopt,
                            std::make_exception_ptr(errors::MalformedEventError("invalid JSON message"))}};
    }

    if (!doc.is_array()) {
        doc = json::array({std::move(doc)});
    }

    std::vector<DecodedItem> items;
    items.reserve(doc.size());
    for (const auto& obj : doc) {
        try {
            items.push_back(DecodedItem{from_json(obj), nullptr});
        } catch (const errors::MalformedEventError&) {
            items.push_back(DecodedItem{std::nullopt, std::current_exception()});
        }
    }
    return items;
}

std::string EventCodec::encode_body(const ConfigEventVariant& event) const {
    return std::visit([](const auto& e) { return body_of(e).dump(); }, event);
}

ConfigEventVariant EventCodec::decode_body(const ConfigEvent& header,
                                           const std::string& event_type,
                                           const std::string& body) const {
    auto obj = json::parse(body, nullptr, false);
    if (obj.is_discarded()) {
        throw errors::MalformedEventError("invalid JSON body", header.sequence_number);
    }
    return parse_body(header, event_type, obj);
}

std::string EventCodec::encode_state(const ConfigState& state) const {
    json markups = json::object();
    for (const auto& [category, rate] : state.get_markups()) {
        markups[category] = rate.value();
    }

    json brands = json::object();
    for (const auto& [code, name] : state.get_brands()) {
        brands[code.value()] = name;
    }

    json doc{
        {"schema_version", kSchemaVersion},
        {"as_of_sequence_number", state.get_as_of_sequence_number()},
        {"last_updated_ms", state.get_last_updated().milliseconds()},
        {"default_markup", state.get_default_markup().value()},
        {"markups", std::move(markups)},
        {"brands", std::move(brands)},
    };
    return doc.dump();
}

ConfigState EventCodec::decode_state(const std::string& json_str) const {
    auto doc = parse_document(json_str);
    if (!doc.is_object()) {
        throw errors::MalformedEventError("snapshot is not an object");
    }
    check_schema_version(doc, std::nullopt);

    try {
        ConfigState::MarkupMap markups;
        for (const auto& item : doc.at("markups").items()) {
            markups.emplace(item.key(), MarkupRate(item.value().get<double>()));
        }

        ConfigState::BrandMap brands;
        for (const auto& item : doc.at("brands").items()) {
            brands.emplace(BrandCode(item.key()), item.value().get<std::string>());
        }

        auto as_of = doc.at("as_of_sequence_number").get<int64_t>();
        if (as_of < ConfigState::kEmptySequenceNumber) {
            throw errors::MalformedEventError("snapshot sequence number below -1");
        }

        return ConfigState::restore(
            as_of,
            MarkupRate(doc.value("default_markup", 0.0)),
            std::move(markups),
            std::move(brands),
            Timestamp(doc.value("last_updated_ms", int64_t{0})));
    } catch (const json::exception& e) {
        throw errors::MalformedEventError(std::string("snapshot: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw errors::MalformedEventError(std::string("snapshot: ") + e.what());
    } catch (const std::out_of_range& e) {
        throw errors::MalformedEventError(std::string("snapshot: ") + e.what());
    }
}

} // namespace cre::infrastructure
