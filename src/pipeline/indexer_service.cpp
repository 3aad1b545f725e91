#include <algorithm>
#include <chainwatch/pipeline/indexer_service.hpp>
#include <chrono>
#include <iostream>

namespace chainwatch::pipeline {

    IndexerService::IndexerService(config::IndexerConfig config, BlockSource &source)
        : config_(std::move(config)), source_(source) {}

    IndexerService::~IndexerService() { stop(); }

    Result<void, Error> IndexerService::open() {
        if (opened_)
            return Result<void, Error>::ok();

        for (const auto &chain : config_.chains) {
            auto task = std::make_unique<ChainTask>();
            task->chain = chain;
            task->store = std::make_unique<storage::SqliteStore>();

            auto opened = task->store->open(config_.database.path, config_.database.options);
            if (!opened.is_ok())
                return opened;

            // Every connection applies the schema; migrations already recorded are skipped
            auto schema = task->store->initializeSchema();
            if (!schema.is_ok())
                return schema;

            task->indexer =
                std::make_unique<ChainIndexer>(chain, *task->store, source_, config_.anomaly_detection);

            for (const auto &token : chain.tokens) {
                auto seeded = task->indexer->tokens().upsert(token);
                if (!seeded.is_ok())
                    return seeded;
            }
            chains_[chain.chain_id] = std::move(task);
        }

        opened_ = true;
        return Result<void, Error>::ok();
    }

    Result<void, Error> IndexerService::start() {
        if (running_.load())
            return Result<void, Error>::ok();

        auto opened = open();
        if (!opened.is_ok())
            return opened;

        stop_requested_ = false;
        running_ = true;
        for (auto &[chain_id, task] : chains_) {
            std::cout << "[service] Starting chain " << task->chain.name << " (" << chain_id << ")" << std::endl;
            ChainTask *raw = task.get();
            task->thread = std::thread([this, raw]() { run(*raw); });
        }
        return Result<void, Error>::ok();
    }

    void IndexerService::stop() {
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            stop_requested_ = true;
        }
        wake_.notify_all();

        for (auto &[chain_id, task] : chains_) {
            if (task->thread.joinable())
                task->thread.join();
        }
        running_ = false;
    }

    bool IndexerService::waitFor(i64 millis) {
        std::unique_lock<std::mutex> lock(wait_mutex_);
        wake_.wait_for(lock, std::chrono::milliseconds(millis), [this]() { return stop_requested_.load(); });
        return !stop_requested_.load();
    }

    ChainIndexer *IndexerService::indexer(i64 chain_id) {
        auto it = chains_.find(chain_id);
        if (it == chains_.end())
            return nullptr;
        return it->second->indexer.get();
    }

    std::vector<ChainHealth> IndexerService::health() const {
        std::vector<ChainHealth> all;
        for (const auto &[chain_id, task] : chains_) {
            all.push_back(task->indexer->health());
        }
        return all;
    }

    Result<PumpResult, Error> IndexerService::pump(i64 chain_id, i64 max_blocks) {
        ChainIndexer *chain = indexer(chain_id);
        if (!chain)
            return Result<PumpResult, Error>::err(
                dp::Error::not_found(dp::String(("Chain " + std::to_string(chain_id) + " is not open").c_str())));

        PumpResult result;
        for (i64 step = 0; step < max_blocks; ++step) {
            if (chain->requiresResume()) {
                result.halted = true;
                break;
            }

            auto height = chain->nextHeight();
            if (!height.is_ok())
                return Result<PumpResult, Error>::err(height.error());

            auto fetched = source_.fetchBlock(chain_id, height.value());
            if (!fetched.is_ok()) {
                chain->reportFetchError(fetched.error());
                return Result<PumpResult, Error>::err(fetched.error());
            }
            if (!fetched.value().has_value()) {
                result.idle = true;
                break;
            }

            auto outcome = chain->advance(*fetched.value());
            if (!outcome.is_ok()) {
                if (isTransient(outcome.error()))
                    return Result<PumpResult, Error>::err(outcome.error());
                result.halted = chain->isHalted();
                break;
            }

            if (outcome.value().kind == AdvanceKind::RolledBack)
                ++result.rollbacks;
            else
                ++result.blocks_applied;
        }
        return Result<PumpResult, Error>::ok(result);
    }

    void IndexerService::run(ChainTask &task) {
        const i64 chain_id = task.chain.chain_id;
        i64 backoff = config_.retry.initial_backoff_ms;

        while (!stop_requested_.load()) {
            auto pumped = pump(chain_id, 1);
            if (!pumped.is_ok()) {
                std::cout << "[chain " << task.chain.name << "] Retrying in " << backoff
                          << "ms: " << errorMessage(pumped.error()) << std::endl;
                if (!waitFor(backoff))
                    break;
                backoff = std::min(backoff * 2, config_.retry.max_backoff_ms);
                continue;
            }

            backoff = config_.retry.initial_backoff_ms;
            const PumpResult &result = pumped.value();
            // A halted chain waits for resume(); an idle one for new blocks
            if (result.idle || result.halted) {
                if (!waitFor(task.chain.poll_interval_ms))
                    break;
            }
        }
    }

} // namespace chainwatch::pipeline
