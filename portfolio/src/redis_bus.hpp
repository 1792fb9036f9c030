#pragma once

#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

struct StreamMessage {
    std::string id;
    nlohmann::json payload;
};

// Command/reply transport over Redis streams. Each entry carries one JSON
// document in its "data" field.
class RedisBus {
public:
    explicit RedisBus(const std::string& redis_url);

    void create_consumer_group(const std::string& stream, const std::string& group);

    std::vector<StreamMessage> read_commands(const std::string& stream, const std::string& group,
                                             const std::string& consumer, int count = 10,
                                             int block_ms = 1000);

    void publish_reply(const std::string& stream, const nlohmann::json& data);
    // Best effort; failures are logged only.
    void publish_audit(const std::string& stream, const nlohmann::json& data);

    void ack_message(const std::string& stream, const std::string& group, const std::string& msg_id);

    bool ping();

private:
    static constexpr long long kMaxStreamLength = 10000;

    std::shared_ptr<sw::redis::Redis> redis_;

    void append(const std::string& stream, const nlohmann::json& data);
};
