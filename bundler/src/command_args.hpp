#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

// Optional arguments shared by the buy and sell commands. Absent or null
// values yield nullopt; anything else must be well formed.

// Throws std::invalid_argument when present but not a list of indices.
std::optional<std::vector<size_t>> parse_identities(const nlohmann::json& args);

// Throws std::invalid_argument when present but not a lamport amount.
std::optional<uint64_t> parse_tip(const nlohmann::json& args);
