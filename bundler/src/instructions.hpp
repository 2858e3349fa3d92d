#pragma once

#include "solana_types.hpp"
#include <cstdint>

namespace instructions {
    extern const char* const COMPUTE_BUDGET_PROGRAM_ID;
    extern const char* const SYSTEM_PROGRAM_ID;

    Pubkey compute_budget_program();
    Pubkey system_program();

    Instruction set_compute_unit_limit(uint32_t units);
    // Price in micro-lamports per compute unit.
    Instruction set_compute_unit_price(uint64_t micro_lamports);
    Instruction set_loaded_accounts_data_size_limit(uint32_t bytes);

    Instruction system_transfer(const Pubkey& from, const Pubkey& to, uint64_t lamports);
}
