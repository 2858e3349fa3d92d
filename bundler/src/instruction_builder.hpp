#pragma once

#include "http_client.hpp"
#include "solana_types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Instructions for one identity's buy or sell, plus the compute budget the
// builder asks for.
struct InstructionPlan {
    std::vector<Instruction> instructions;
    std::optional<uint32_t> compute_unit_limit;
    std::optional<uint64_t> priority_fee;
};

class InstructionBuilder {
public:
    virtual ~InstructionBuilder() = default;

    // Throw TransactionBuildError when no plan can be produced.
    virtual InstructionPlan build_buy(const std::string& target, const Pubkey& owner, uint64_t lamports) = 0;
    virtual InstructionPlan build_sell(const std::string& target, const Pubkey& owner, uint64_t token_amount) = 0;
};

// POSTs {side, target, owner, amount} to an external instruction service.
class HttpInstructionBuilder : public InstructionBuilder {
public:
    HttpInstructionBuilder(std::string url, std::shared_ptr<HttpClient> http, int timeout_ms = 10000);

    InstructionPlan build_buy(const std::string& target, const Pubkey& owner, uint64_t lamports) override;
    InstructionPlan build_sell(const std::string& target, const Pubkey& owner, uint64_t token_amount) override;

    static InstructionPlan parse_plan(const nlohmann::json& body);

private:
    std::string url_;
    std::shared_ptr<HttpClient> http_;
    int timeout_ms_;

    InstructionPlan request(const std::string& side, const std::string& target,
                            const Pubkey& owner, uint64_t amount);
};
