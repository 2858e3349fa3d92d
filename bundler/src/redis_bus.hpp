#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

struct BusCommand {
    std::string msg_id;
    nlohmann::json body;
};

// Request/reply/audit streams. Messages carry one "data" field holding JSON.
class RedisBus {
public:
    RedisBus(const std::string& redis_url, std::string group, std::string consumer);

    void ensure_group(const std::string& stream);

    // Malformed entries are acked and dropped.
    std::vector<BusCommand> read_commands(const std::string& stream, size_t count = 10,
                                          std::chrono::milliseconds block = std::chrono::milliseconds(1000));
    void ack(const std::string& stream, const std::string& msg_id);

    // Throws sw::redis::Error.
    void publish_reply(const std::string& stream, const nlohmann::json& data);
    // Logged, never thrown.
    void publish_audit(const std::string& stream, const nlohmann::json& data) noexcept;

    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string group_;
    std::string consumer_;

    void append(const std::string& stream, const nlohmann::json& data);
};
