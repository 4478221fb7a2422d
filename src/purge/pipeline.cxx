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

#include <txnpurge/logging.hxx>
#include <txnpurge/purge/collection_classifier.hxx>
#include <txnpurge/purge/exceptions.hxx>
#include <txnpurge/purge/machine_queue_fixer.hxx>
#include <txnpurge/purge/pipeline.hxx>

namespace txnpurge
{
namespace purge
{
    purge_pipeline::purge_pipeline(database& db, const purge_config& config)
      : db_(db)
      , config_(config)
    {
    }

    std::vector<pipeline_stage> purge_pipeline::plan() const
    {
        std::vector<pipeline_stage> stages{ pipeline_stage::REPAIR_SINGLETON,
                                            pipeline_stage::CLASSIFY_COLLECTIONS,
                                            pipeline_stage::PURGE_ORPHANS };
        if (config_.fix_machines()) {
            stages.push_back(pipeline_stage::FIX_MACHINE_QUEUES);
        }
        if (config_.prune()) {
            stages.push_back(pipeline_stage::PRUNE_TRANSACTION_LOG);
        }
        if (config_.compact()) {
            stages.push_back(pipeline_stage::COMPACT_STORAGE);
        }
        return stages;
    }

    const known_transactions& purge_pipeline::known()
    {
        if (!known_) {
            purge_log->info("Building index of known transactions from {} and {}...",
                            config_.txns_collection(),
                            config_.stash_collection());
            known_ = known_transactions::build(db_, config_);
            purge_log->info("{} known transactions ({} stashed)", known_->size(), known_->stashed());
        }
        return *known_;
    }

    void purge_pipeline::execute(pipeline_stage stage, pipeline_result& result)
    {
        switch (stage) {
            case pipeline_stage::REPAIR_SINGLETON:
                purge_log->info("Repairing runaway transactions for {} document...", config_.singleton_id());
                result.singleton = repair_singleton_queue(db_, known(), config_);
                break;
            case pipeline_stage::CLASSIFY_COLLECTIONS: {
                std::vector<std::string> catalog;
                try {
                    catalog = db_.collection_names();
                } catch (const purge_error&) {
                    throw;
                } catch (const std::exception& e) {
                    throw purge_error(FAIL_CATALOG, e.what());
                }
                result.collections = purgeable_collections(catalog, config_);
                purge_log->info("{} of {} collections are purgeable", result.collections.size(), catalog.size());
                break;
            }
            case pipeline_stage::PURGE_ORPHANS:
                purge_log->info("Purging orphaned transactions for {} collections...", result.collections.size());
                result.orphans = purge_orphans(db_, known(), result.collections, config_);
                purge_log->info("Done purging orphaned transactions.");
                break;
            case pipeline_stage::FIX_MACHINE_QUEUES:
                purge_log->info("Removing references to completed transactions in {} collection...", config_.machines_collection());
                result.machines = fix_machine_queues(db_, known(), config_);
                break;
            case pipeline_stage::PRUNE_TRANSACTION_LOG:
                purge_log->info("Pruning unreferenced transactions...");
                result.pruned = prune_transactions(db_, result.collections, config_);
                break;
            case pipeline_stage::COMPACT_STORAGE:
                purge_log->info("Compacting database to release disk space...");
                db_.compact();
                break;
            default:
                throw std::logic_error(std::string("not a runnable stage: ") + pipeline_stage_name(stage));
        }
    }

    pipeline_result purge_pipeline::run()
    {
        pipeline_result result;
        for (auto stage : plan()) {
            result.state = stage;
            result.executed.push_back(stage);
            purge_log->debug("stage {} starting", pipeline_stage_name(stage));
            try {
                execute(stage, result);
            } catch (const std::exception& e) {
                purge_log->error("{}: {}", pipeline_stage_name(stage), e.what());
                result.failed_stage = stage;
                result.error = e.what();
                result.state = pipeline_stage::FAILED;
                return result;
            }
            purge_log->debug("stage {} complete", pipeline_stage_name(stage));
        }
        result.state = pipeline_stage::DONE;
        purge_log->info("Done.");
        return result;
    }
} // namespace purge
} // namespace txnpurge
