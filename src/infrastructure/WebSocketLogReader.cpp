#include "infrastructure/WebSocketLogReader.hpp"

#include "errors/ReplicationErrors.hpp"
#include "infrastructure/BlockingQueue.hpp"

#include <ixwebsocket/IXHttpClient.h>
#include <ixwebsocket/IXWebSocket.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <optional>

using json = nlohmann::json;
using namespace cre::domain;

namespace cre::infrastructure {

namespace {

class WebSocketSubscription : public cre::services::ILogSubscription {
public:
    WebSocketSubscription(const std::string& url, const cre::config::LogSettings& settings,
                          const EventCodec& codec)
        : codec_(codec)
        , read_timeout_(std::chrono::seconds(settings.read_timeout_seconds)) {
        ws_.setUrl(url);
        ws_.setPingInterval(settings.ping_interval_seconds);
        ws_.setHandshakeTimeout(settings.connect_timeout_seconds);
        ws_.disableAutomaticReconnection();

        ws_.setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg) {
            on_message(msg);
        });
        ws_.start();
    }

    ~WebSocketSubscription() override {
        cancel();
        ws_.stop();
    }

    std::optional<ConfigEventVariant> next() override {
        std::optional<DecodedItem> item;
        auto status = queue_.pop_for(read_timeout_, item);

        if (status == BlockingQueue<DecodedItem>::PopStatus::Closed) {
            return std::nullopt;
        }
        if (status == BlockingQueue<DecodedItem>::PopStatus::Timeout) {
            throw errors::TransientTransportError(
                "read timeout after " + std::to_string(read_timeout_.count()) + "s");
        }
        if (item->error) {
            std::rethrow_exception(item->error);
        }
        return std::move(item->event);
    }

    void cancel() override {
        cancelled_ = true;
        queue_.close();
    }

private:
    void on_message(const ix::WebSocketMessagePtr& msg) {
        switch (msg->type) {
            case ix::WebSocketMessageType::Message:
                decode(msg->str);
                break;

            case ix::WebSocketMessageType::Close:
                push_error(errors::TransientTransportError(
                    "connection closed: " + msg->closeInfo.reason));
                break;

            case ix::WebSocketMessageType::Error:
                push_error(errors::TransientTransportError(
                    "connection error: " + msg->errorInfo.reason));
                break;

            default:
                break;
        }
    }

    void decode(const std::string& text) {
        for (auto& item : codec_.decode_frame(text)) {
            queue_.push(std::move(item));
        }
    }

    template <typename Error>
    void push_error(Error error) {
        if (cancelled_) return;
        queue_.push(DecodedItem{std::nullopt, std::make_exception_ptr(std::move(error))});
    }

    ix::WebSocket ws_;
    EventCodec codec_;
    BlockingQueue<DecodedItem> queue_;
    std::chrono::seconds read_timeout_;
    std::atomic<bool> cancelled_{false};
};

} // anonymous namespace

WebSocketLogReader::WebSocketLogReader(const cre::config::LogSettings& settings)
    : settings_(settings) {}

std::string WebSocketLogReader::floor_url(const std::string& partition_key) const {
    return settings_.http_base_url + "/partitions/" + partition_key + "/floor";
}

std::string WebSocketLogReader::stream_url(const std::string& partition_key,
                                           int64_t from_sequence) const {
    return settings_.stream_url + "/partitions/" + partition_key
        + "?from=" + std::to_string(from_sequence);
}

int64_t WebSocketLogReader::oldest_available_sequence(const std::string& partition_key) const {
    ix::HttpClient client;
    auto args = client.createRequest();
    args->connectTimeout = settings_.connect_timeout_seconds;
    args->transferTimeout = settings_.read_timeout_seconds > 0
        ? settings_.read_timeout_seconds : 30;

    auto url = floor_url(partition_key);
    auto response = client.get(url, args);
    if (response->statusCode != 200) {
        throw errors::TransientTransportError(
            "GET " + url + " returned " + std::to_string(response->statusCode)
            + (response->errorMsg.empty() ? "" : ": " + response->errorMsg));
    }

    auto doc = json::parse(response->body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()
        || !doc.contains("oldest_available_sequence")
        || !doc["oldest_available_sequence"].is_number_integer()) {
        throw errors::TransientTransportError("GET " + url + " returned an unexpected body");
    }
    return doc["oldest_available_sequence"].get<int64_t>();
}

std::unique_ptr<cre::services::ILogSubscription> WebSocketLogReader::subscribe(
    const std::string& partition_key, int64_t from_sequence_inclusive) {
    auto url = stream_url(partition_key, from_sequence_inclusive);
    std::cout << "[log] Subscribing " << url << std::endl;
    return std::make_unique<WebSocketSubscription>(url, settings_, codec_);
}

} // namespace cre::infrastructure
