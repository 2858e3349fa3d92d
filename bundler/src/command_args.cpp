#include "command_args.hpp"
#include <stdexcept>
#include <string>

std::optional<std::vector<size_t>> parse_identities(const nlohmann::json& args) {
    if (!args.contains("identities") || args["identities"].is_null()) {
        return std::nullopt;
    }
    const auto& list = args["identities"];
    if (!list.is_array()) {
        throw std::invalid_argument("identities must be a list of indices");
    }
    std::vector<size_t> indices;
    for (const auto& v : list) {
        if (!v.is_number_unsigned()) {
            throw std::invalid_argument("identity index " + v.dump() + " is not a non-negative integer");
        }
        indices.push_back(v.get<size_t>());
    }
    return indices;
}

std::optional<uint64_t> parse_tip(const nlohmann::json& args) {
    if (!args.contains("tip_lamports") || args["tip_lamports"].is_null()) {
        return std::nullopt;
    }
    if (!args["tip_lamports"].is_number_unsigned()) {
        throw std::invalid_argument("tip_lamports must be a non-negative integer");
    }
    return args["tip_lamports"].get<uint64_t>();
}
