#include <chainwatch/pipeline/block_source.hpp>
#include <fstream>
#include <nlohmann/json.hpp>

namespace chainwatch::pipeline {

    using nlohmann::json;

    // ===========================================
    // MemoryBlockSource
    // ===========================================

    void MemoryBlockSource::put(i64 chain_id, FetchedBlock block) {
        std::lock_guard<std::mutex> lock(mutex_);
        block.chain_id = chain_id;
        i64 number = block.number;
        blocks_[chain_id][number] = std::move(block);
    }

    void MemoryBlockSource::putAll(const std::vector<FetchedBlock> &blocks) {
        for (const auto &block : blocks) {
            put(block.chain_id, block);
        }
    }

    Result<std::optional<FetchedBlock>, Error> MemoryBlockSource::fetchBlock(i64 chain_id, i64 height) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto chain = blocks_.find(chain_id);
        if (chain == blocks_.end())
            return Result<std::optional<FetchedBlock>, Error>::ok(std::nullopt);
        auto block = chain->second.find(height);
        if (block == chain->second.end())
            return Result<std::optional<FetchedBlock>, Error>::ok(std::nullopt);
        return Result<std::optional<FetchedBlock>, Error>::ok(block->second);
    }

    std::optional<i64> MemoryBlockSource::highest(i64 chain_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto chain = blocks_.find(chain_id);
        if (chain == blocks_.end() || chain->second.empty())
            return std::nullopt;
        return chain->second.rbegin()->first;
    }

    // ===========================================
    // JSON blocks
    // ===========================================

    namespace {

        /// Amounts may arrive as decimal strings or as JSON integers
        std::string amountText(const json &value) {
            if (value.is_string())
                return value.get<std::string>();
            if (value.is_number_unsigned())
                return std::to_string(value.get<u64>());
            if (value.is_number_integer())
                return std::to_string(value.get<i64>());
            return std::string();
        }

    } // namespace

    Result<FetchedBlock, Error> parseBlockJson(const std::string &text) {
        try {
            json j = json::parse(text);

            FetchedBlock block;
            block.chain_id = j.at("chain_id").get<i64>();
            block.number = j.at("number").get<i64>();
            block.hash = j.at("hash").get<std::string>();
            block.parent_hash = j.at("parent_hash").get<std::string>();
            block.timestamp = j.value("timestamp", static_cast<i64>(0));

            if (j.contains("transfers")) {
                for (const auto &t : j["transfers"]) {
                    FetchedTransfer transfer;
                    transfer.tx_hash = t.at("tx_hash").get<std::string>();
                    transfer.log_index = t.at("log_index").get<i32>();
                    transfer.token_address = t.value("token_address", std::string());
                    transfer.from = t.at("from").get<std::string>();
                    transfer.to = t.at("to").get<std::string>();
                    transfer.amount = amountText(t.at("amount"));
                    transfer.symbol = t.value("symbol", std::string());
                    transfer.decimals = static_cast<i16>(t.value("decimals", 0));
                    block.transfers.push_back(std::move(transfer));
                }
            }
            return Result<FetchedBlock, Error>::ok(std::move(block));
        } catch (const json::exception &e) {
            return Result<FetchedBlock, Error>::err(invalid_block(std::string("Malformed block JSON: ") + e.what()));
        }
    }

    Result<std::vector<FetchedBlock>, Error> loadBlocksJsonl(const std::string &path) {
        std::ifstream file(path);
        if (!file.is_open())
            return Result<std::vector<FetchedBlock>, Error>::err(dp::Error::io_error(dp::String(path.c_str())));

        std::vector<FetchedBlock> blocks;
        std::string line;
        size_t line_no = 0;
        while (std::getline(file, line)) {
            ++line_no;
            if (line.find_first_not_of(" \t\r") == std::string::npos)
                continue;
            auto block = parseBlockJson(line);
            if (!block.is_ok()) {
                return Result<std::vector<FetchedBlock>, Error>::err(
                    invalid_block(path + ":" + std::to_string(line_no) + ": " + errorMessage(block.error())));
            }
            blocks.push_back(std::move(block.value()));
        }
        return Result<std::vector<FetchedBlock>, Error>::ok(std::move(blocks));
    }

} // namespace chainwatch::pipeline
