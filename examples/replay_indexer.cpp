/**
 * Example: replay recorded blocks through the indexer
 *
 * Usage: chainwatch_replay --config <config.json> --blocks <blocks.jsonl>
 *
 * Every configured chain is driven until its blocks are drained or it halts,
 * then per-chain health is printed.
 */

#include <chainwatch/chainwatch.hpp>
#include <iostream>
#include <string>

using namespace chainwatch;
using namespace chainwatch::pipeline;

namespace {

    void printUsage(const char *program) {
        std::cerr << "Usage: " << program << " --config <config.json> --blocks <blocks.jsonl>" << std::endl;
    }

} // namespace

int main(int argc, char **argv) {
    std::string config_path;
    std::string blocks_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--blocks" && i + 1 < argc) {
            blocks_path = argv[++i];
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }
    if (config_path.empty() || blocks_path.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    auto config = config::loadConfig(config_path);
    if (!config.is_ok()) {
        std::cerr << "[Replay] " << errorMessage(config.error()) << std::endl;
        return 1;
    }

    auto blocks = loadBlocksJsonl(blocks_path);
    if (!blocks.is_ok()) {
        std::cerr << "[Replay] " << errorMessage(blocks.error()) << std::endl;
        return 1;
    }

    MemoryBlockSource source;
    source.putAll(blocks.value());
    std::cout << "[Replay] Loaded " << blocks.value().size() << " blocks" << std::endl;

    IndexerService service(config.value(), source);
    auto opened = service.open();
    if (!opened.is_ok()) {
        std::cerr << "[Replay] " << errorMessage(opened.error()) << std::endl;
        return 1;
    }

    for (const auto &chain : service.config().chains) {
        int transient_failures = 0;
        while (true) {
            auto pumped = service.pump(chain.chain_id, 1000);
            if (!pumped.is_ok()) {
                // Retry transient storage failures a few times before giving up on this chain
                if (isTransient(pumped.error()) && ++transient_failures < 5)
                    continue;
                std::cerr << "[Replay] " << chain.name << ": " << errorMessage(pumped.error()) << std::endl;
                break;
            }
            if (pumped.value().idle || pumped.value().halted)
                break;
        }
    }

    std::cout << "\n=== Chain health ===" << std::endl;
    bool all_healthy = true;
    for (const auto &h : service.health()) {
        std::cout << h.name << " (" << h.chain_id << "): " << chainStatusName(h.status) << ", last height ";
        if (h.last_height.has_value())
            std::cout << *h.last_height;
        else
            std::cout << "-";
        if (!h.last_error_kind.empty())
            std::cout << ", last error " << h.last_error_kind << ": " << h.last_error_message;
        std::cout << std::endl;
        all_healthy = all_healthy && h.status == ChainStatus::Healthy;
    }

    return all_healthy ? 0 : 1;
}
