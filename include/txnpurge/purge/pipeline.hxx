/*
 *     Copyright 2021 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

#include <txnpurge/purge/database.hxx>
#include <txnpurge/purge/known_transactions.hxx>
#include <txnpurge/purge/orphan_purger.hxx>
#include <txnpurge/purge/purge_config.hxx>
#include <txnpurge/purge/singleton_repair.hxx>
#include <txnpurge/purge/txn_pruner.hxx>
#include <txnpurge/support.hxx>

#include <boost/optional.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace txnpurge
{
namespace purge
{
    /**
     * States of a repair run, in the order they are entered.
     */
    enum class pipeline_stage {
        REPAIR_SINGLETON,
        CLASSIFY_COLLECTIONS,
        PURGE_ORPHANS,
        FIX_MACHINE_QUEUES,
        PRUNE_TRANSACTION_LOG,
        COMPACT_STORAGE,
        DONE,
        FAILED
    };

    inline const char* pipeline_stage_name(pipeline_stage stage)
    {
        switch (stage) {
            case pipeline_stage::REPAIR_SINGLETON:
                return "RepairSingleton";
            case pipeline_stage::CLASSIFY_COLLECTIONS:
                return "ClassifyCollections";
            case pipeline_stage::PURGE_ORPHANS:
                return "PurgeOrphans";
            case pipeline_stage::FIX_MACHINE_QUEUES:
                return "FixMachineQueues";
            case pipeline_stage::PRUNE_TRANSACTION_LOG:
                return "PruneTransactionLog";
            case pipeline_stage::COMPACT_STORAGE:
                return "CompactStorage";
            case pipeline_stage::DONE:
                return "Done";
            case pipeline_stage::FAILED:
                return "Failed";
            default:
                throw std::runtime_error("unknown pipeline stage");
        }
    }

    struct pipeline_result {
        pipeline_stage state{ pipeline_stage::REPAIR_SINGLETON };
        // stages that were started, in order; the failing one included
        std::vector<pipeline_stage> executed;
        boost::optional<pipeline_stage> failed_stage;
        std::string error;

        singleton_repair_stats singleton;
        std::vector<std::string> collections;
        queue_purge_stats orphans;
        queue_purge_stats machines;
        prune_stats pruned;

        TXNPURGE_NODISCARD bool success() const
        {
            return state == pipeline_stage::DONE;
        }
    };

    /**
     * @brief Runs the repair stages in order, stopping at the first failure.
     *
     * RepairSingleton -> ClassifyCollections -> PurgeOrphans -> FixMachineQueues ->
     * PruneTransactionLog -> CompactStorage -> Done.  The last three can be switched off in
     * @ref purge_config; a stage that is switched off is skipped but the others keep their
     * order.  Any exception moves the run to Failed, and nothing after it runs.  Nothing is
     * retried: every stage is safe to repeat, so the remedy for a failure is a new run.
     *
     * The caller must make sure nothing else writes transaction state while this runs.
     */
    class purge_pipeline
    {
      public:
        purge_pipeline(database& db, const purge_config& config);

        pipeline_result run();

        /**
         * The stages run() will attempt with the current configuration.
         */
        TXNPURGE_NODISCARD std::vector<pipeline_stage> plan() const;

      private:
        database& db_;
        const purge_config config_;
        boost::optional<known_transactions> known_;

        void execute(pipeline_stage stage, pipeline_result& result);
        const known_transactions& known();
    };
} // namespace purge
} // namespace txnpurge
