#include "instruction_builder.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

HttpInstructionBuilder::HttpInstructionBuilder(std::string url, std::shared_ptr<HttpClient> http, int timeout_ms)
    : url_(std::move(url))
    , http_(std::move(http))
    , timeout_ms_(timeout_ms)
{
    if (!http_) {
        throw ConstructionError("HttpInstructionBuilder requires an HTTP client");
    }
}

InstructionPlan HttpInstructionBuilder::build_buy(const std::string& target, const Pubkey& owner, uint64_t lamports) {
    return request("buy", target, owner, lamports);
}

InstructionPlan HttpInstructionBuilder::build_sell(const std::string& target, const Pubkey& owner,
                                                   uint64_t token_amount) {
    return request("sell", target, owner, token_amount);
}

InstructionPlan HttpInstructionBuilder::request(const std::string& side, const std::string& target,
                                                const Pubkey& owner, uint64_t amount) {
    nlohmann::json payload = {
        {"side", side},
        {"target", target},
        {"owner", owner.to_string()},
        {"amount", amount}
    };

    HttpResponse resp;
    try {
        resp = http_->post(url_, payload.dump(), timeout_ms_);
    } catch (const std::exception& e) {
        throw TransactionBuildError("Instruction service unreachable: " + std::string(e.what()));
    }

    if (resp.status != 200) {
        throw TransactionBuildError("Instruction service returned HTTP " + std::to_string(resp.status) +
                                    ": " + resp.body);
    }

    try {
        return parse_plan(nlohmann::json::parse(resp.body));
    } catch (const TransactionBuildError&) {
        throw;
    } catch (const std::exception& e) {
        throw TransactionBuildError("Malformed instruction plan: " + std::string(e.what()));
    }
}

InstructionPlan HttpInstructionBuilder::parse_plan(const nlohmann::json& body) {
    if (body.contains("error")) {
        throw TransactionBuildError("Instruction service error: " + body["error"].dump());
    }

    InstructionPlan plan;
    for (const auto& ix_json : body.at("instructions")) {
        Instruction ix;
        ix.program_id = Pubkey::from_string(ix_json.at("program_id").get<std::string>());
        for (const auto& acc : ix_json.at("accounts")) {
            AccountMeta meta;
            meta.pubkey = Pubkey::from_string(acc.at("pubkey").get<std::string>());
            meta.is_signer = acc.value("is_signer", false);
            meta.is_writable = acc.value("is_writable", false);
            ix.accounts.push_back(meta);
        }
        ix.data = util::base64_decode(ix_json.value("data", ""));
        plan.instructions.push_back(std::move(ix));
    }

    if (plan.instructions.empty()) {
        throw TransactionBuildError("Instruction plan is empty");
    }
    if (body.contains("compute_unit_limit") && body["compute_unit_limit"].is_number()) {
        plan.compute_unit_limit = body["compute_unit_limit"].get<uint32_t>();
    }
    if (body.contains("priority_fee") && body["priority_fee"].is_number()) {
        plan.priority_fee = body["priority_fee"].get<uint64_t>();
    }
    return plan;
}
