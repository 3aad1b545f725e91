#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace chainwatch {

    // ===========================================
    // Chainwatch-specific error codes (200+)
    // ===========================================

    constexpr dp::u32 ERR_GAP = 200;
    constexpr dp::u32 ERR_DEEP_REORG = 201;
    constexpr dp::u32 ERR_TRANSIENT_STORE = 202;
    constexpr dp::u32 ERR_STORE = 203;
    constexpr dp::u32 ERR_CHAIN_HALTED = 204;
    constexpr dp::u32 ERR_ANCESTRY_UNAVAILABLE = 205;
    constexpr dp::u32 ERR_INVALID_BLOCK = 206;
    constexpr dp::u32 ERR_INVALID_AMOUNT = 207;
    constexpr dp::u32 ERR_CONFIG = 208;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error gap(const std::string &msg = "Missing block heights") {
        return dp::Error{ERR_GAP, dp::String(msg.c_str())};
    }

    inline dp::Error deep_reorg(const std::string &msg = "Reorg exceeds maximum depth") {
        return dp::Error{ERR_DEEP_REORG, dp::String(msg.c_str())};
    }

    inline dp::Error transient_store(const std::string &msg = "Storage temporarily unavailable") {
        return dp::Error{ERR_TRANSIENT_STORE, dp::String(msg.c_str())};
    }

    inline dp::Error store_failed(const std::string &msg = "Storage operation failed") {
        return dp::Error{ERR_STORE, dp::String(msg.c_str())};
    }

    inline dp::Error chain_halted(const std::string &msg = "Chain ingestion is halted") {
        return dp::Error{ERR_CHAIN_HALTED, dp::String(msg.c_str())};
    }

    inline dp::Error ancestry_unavailable(const std::string &msg = "Block source cannot supply ancestor header") {
        return dp::Error{ERR_ANCESTRY_UNAVAILABLE, dp::String(msg.c_str())};
    }

    inline dp::Error invalid_block(const std::string &msg = "Invalid block") {
        return dp::Error{ERR_INVALID_BLOCK, dp::String(msg.c_str())};
    }

    inline dp::Error invalid_amount(const std::string &msg = "Invalid amount") {
        return dp::Error{ERR_INVALID_AMOUNT, dp::String(msg.c_str())};
    }

    inline dp::Error config_error(const std::string &msg = "Invalid configuration") {
        return dp::Error{ERR_CONFIG, dp::String(msg.c_str())};
    }

    // ===========================================
    // Classification
    // ===========================================

    /// Taxonomy name reported through chain health
    inline const char *errorKindName(dp::u32 code) {
        switch (code) {
        case ERR_GAP:
            return "GapError";
        case ERR_DEEP_REORG:
            return "DeepReorgError";
        case ERR_TRANSIENT_STORE:
            return "TransientStoreError";
        case ERR_STORE:
            return "StoreError";
        case ERR_CHAIN_HALTED:
            return "ChainHalted";
        case ERR_ANCESTRY_UNAVAILABLE:
            return "AncestryUnavailable";
        case ERR_INVALID_BLOCK:
            return "InvalidBlock";
        case ERR_INVALID_AMOUNT:
            return "InvalidAmount";
        case ERR_CONFIG:
            return "ConfigError";
        default:
            return "Error";
        }
    }

    inline bool isTransient(const dp::Error &error) { return error.code == ERR_TRANSIENT_STORE; }

    inline std::string errorMessage(const dp::Error &error) { return std::string(error.message.c_str()); }

} // namespace chainwatch
