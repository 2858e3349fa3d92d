#include "instructions.hpp"

namespace instructions {

const char* const COMPUTE_BUDGET_PROGRAM_ID = "ComputeBudget111111111111111111111111111111";
const char* const SYSTEM_PROGRAM_ID = "11111111111111111111111111111111";

namespace {
void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

void put_u64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
}
}

Pubkey compute_budget_program() {
    static const Pubkey key = Pubkey::from_string(COMPUTE_BUDGET_PROGRAM_ID);
    return key;
}

Pubkey system_program() {
    return Pubkey{};
}

Instruction set_compute_unit_limit(uint32_t units) {
    Instruction ix;
    ix.program_id = compute_budget_program();
    ix.data.push_back(2);
    put_u32(ix.data, units);
    return ix;
}

Instruction set_compute_unit_price(uint64_t micro_lamports) {
    Instruction ix;
    ix.program_id = compute_budget_program();
    ix.data.push_back(3);
    put_u64(ix.data, micro_lamports);
    return ix;
}

Instruction set_loaded_accounts_data_size_limit(uint32_t bytes) {
    Instruction ix;
    ix.program_id = compute_budget_program();
    ix.data.push_back(4);
    put_u32(ix.data, bytes);
    return ix;
}

Instruction system_transfer(const Pubkey& from, const Pubkey& to, uint64_t lamports) {
    Instruction ix;
    ix.program_id = system_program();
    ix.accounts.push_back(AccountMeta::writable(from, true));
    ix.accounts.push_back(AccountMeta::writable(to, false));
    put_u32(ix.data, 2);
    put_u64(ix.data, lamports);
    return ix;
}

}
