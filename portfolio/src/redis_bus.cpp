#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

RedisBus::RedisBus(const std::string& redis_url) {
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Connected to Redis: {}", redis_url);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

void RedisBus::create_consumer_group(const std::string& stream, const std::string& group) {
    try {
        redis_->xgroup_create(stream, group, "$", true);
        spdlog::info("Created consumer group {} on stream {}", group, stream);
    } catch (const sw::redis::ReplyError& e) {
        // BUSYGROUP: already there from an earlier run.
        spdlog::debug("Consumer group {} exists: {}", group, e.what());
    }
}

std::vector<StreamMessage> RedisBus::read_commands(const std::string& stream, const std::string& group,
                                                   const std::string& consumer, int count, int block_ms) {
    std::vector<StreamMessage> results;

    using Attrs = std::unordered_map<std::string, std::string>;
    using Item = std::pair<std::string, Attrs>;
    using ItemStream = std::vector<Item>;
    std::unordered_map<std::string, ItemStream> items;

    try {
        redis_->xreadgroup(group, consumer, stream, ">", count,
                           std::chrono::milliseconds(block_ms),
                           std::inserter(items, items.end()));
    } catch (const sw::redis::ReplyError& e) {
        if (std::string(e.what()).find("NOGROUP") != std::string::npos) {
            spdlog::warn("Consumer group {} vanished from {}, recreating", group, stream);
            create_consumer_group(stream, group);
            return results;
        }
        throw;
    }

    for (const auto& [stream_name, item_stream] : items) {
        for (const auto& [msg_id, attrs] : item_stream) {
            auto it = attrs.find("data");
            if (it == attrs.end()) {
                spdlog::warn("Stream entry {} has no data field, acking", msg_id);
                ack_message(stream, group, msg_id);
                continue;
            }
            try {
                results.push_back({msg_id, nlohmann::json::parse(it->second)});
            } catch (const nlohmann::json::parse_error& e) {
                spdlog::error("Dropping malformed command {}: {}", msg_id, e.what());
                ack_message(stream, group, msg_id);
            }
        }
    }

    return results;
}

void RedisBus::append(const std::string& stream, const nlohmann::json& data) {
    std::unordered_map<std::string, std::string> fields;
    fields["data"] = data.dump();
    redis_->xadd(stream, "*", fields.begin(), fields.end(), kMaxStreamLength, true);
}

void RedisBus::publish_reply(const std::string& stream, const nlohmann::json& data) {
    try {
        append(stream, data);
        spdlog::debug("Published reply to {}", stream);
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish reply: {}", e.what());
        throw;
    }
}

void RedisBus::publish_audit(const std::string& stream, const nlohmann::json& data) {
    try {
        append(stream, data);
        spdlog::debug("Published audit event {}", data.value("event", ""));
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish audit: {}", e.what());
    }
}

void RedisBus::ack_message(const std::string& stream, const std::string& group, const std::string& msg_id) {
    try {
        redis_->xack(stream, group, msg_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to ack message {}: {}", msg_id, e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Redis ping failed: {}", e.what());
        return false;
    }
}
