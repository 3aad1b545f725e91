#pragma once

// Chainwatch: multi-chain stablecoin transfer indexer core

#include "chainwatch/anomaly/anomaly_scorer.hpp"
#include "chainwatch/anomaly/rules.hpp"
#include "chainwatch/common/amount.hpp"
#include "chainwatch/common/error.hpp"
#include "chainwatch/common/types.hpp"
#include "chainwatch/config/config.hpp"
#include "chainwatch/entity/entity_attributor.hpp"
#include "chainwatch/entity/label_registry.hpp"
#include "chainwatch/graph/graph_aggregator.hpp"
#include "chainwatch/ingest/checkpoint_store.hpp"
#include "chainwatch/ingest/reorg_detector.hpp"
#include "chainwatch/ingest/token_registry.hpp"
#include "chainwatch/ingest/transfer_recorder.hpp"
#include "chainwatch/pipeline/block_source.hpp"
#include "chainwatch/pipeline/chain_indexer.hpp"
#include "chainwatch/pipeline/indexer_service.hpp"
#include "chainwatch/storage/schema.hpp"
#include "chainwatch/storage/sqlite_store.hpp"
