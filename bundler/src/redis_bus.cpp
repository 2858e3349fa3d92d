#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

RedisBus::RedisBus(const std::string& redis_url, std::string group, std::string consumer)
    : group_(std::move(group))
    , consumer_(std::move(consumer))
{
    try {
        redis_ = std::make_shared<sw::redis::Redis>(redis_url);
        spdlog::info("Connected to Redis: {} (group {}, consumer {})", redis_url, group_, consumer_);
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

void RedisBus::ensure_group(const std::string& stream) {
    try {
        redis_->xgroup_create(stream, group_, "$", true);
        spdlog::info("Created consumer group {} on {}", group_, stream);
    } catch (const sw::redis::ReplyError& e) {
        // BUSYGROUP when the group already exists
        spdlog::debug("Consumer group {} on {}: {}", group_, stream, e.what());
    }
}

std::vector<BusCommand> RedisBus::read_commands(const std::string& stream, size_t count,
                                                std::chrono::milliseconds block) {
    std::vector<BusCommand> commands;

    using Attrs = std::unordered_map<std::string, std::string>;
    using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
    std::unordered_map<std::string, std::vector<Item>> batches;

    redis_->xreadgroup(group_, consumer_, stream, ">", block, static_cast<long long>(count),
                       std::inserter(batches, batches.end()));

    for (const auto& [stream_name, items] : batches) {
        for (const auto& [msg_id, attrs] : items) {
            if (!attrs) {
                ack(stream, msg_id);
                continue;
            }
            auto it = attrs->find("data");
            if (it == attrs->end()) {
                spdlog::warn("Dropping {} on {}: no data field", msg_id, stream_name);
                ack(stream, msg_id);
                continue;
            }
            try {
                commands.push_back({msg_id, nlohmann::json::parse(it->second)});
            } catch (const nlohmann::json::parse_error& e) {
                spdlog::warn("Dropping {} on {}: {}", msg_id, stream_name, e.what());
                ack(stream, msg_id);
            }
        }
    }
    return commands;
}

void RedisBus::ack(const std::string& stream, const std::string& msg_id) {
    try {
        redis_->xack(stream, group_, msg_id);
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to ack {}: {}", msg_id, e.what());
    }
}

void RedisBus::append(const std::string& stream, const nlohmann::json& data) {
    std::unordered_map<std::string, std::string> fields{{"data", data.dump()}};
    redis_->xadd(stream, "*", fields.begin(), fields.end());
}

void RedisBus::publish_reply(const std::string& stream, const nlohmann::json& data) {
    append(stream, data);
    spdlog::debug("Published reply to {}", stream);
}

void RedisBus::publish_audit(const std::string& stream, const nlohmann::json& data) noexcept {
    try {
        append(stream, data);
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish audit event: {}", e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
