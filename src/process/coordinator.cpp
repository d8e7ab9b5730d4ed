// ==============================================================================
// coordinator.cpp - MOD-0010: Processing Coordinator Implementation
// ==============================================================================

#include <unifilter/coordinator.hpp>
#include <unifilter/platform.hpp>
#include <unifilter/validator.hpp>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace unifilter::process {

using rule::ErrorKind;
using rule::RecordKind;
using rule::RuleRecord;
using rule::TranslationStatus;
using rule::ValidationStatus;

rule::RuleRecord process_one(rule::RuleRecord record, const rule::SyntaxDatabase& db,
                             rule::Strategy strategy) {
    return rule::translate(rule::validate(std::move(record), db), db, strategy);
}

void sort_by_origin(std::vector<rule::RuleRecord>& records) {
    std::stable_sort(records.begin(), records.end(), rule::origin_less);
}

ProcessStats collect_stats(const std::vector<rule::RuleRecord>& records) {
    ProcessStats stats;
    stats.total = records.size();

    for (const auto& r : records) {
        if (r.kind != RecordKind::Rule) {
            ++stats.non_rules;
            continue;
        }
        ++stats.rules;

        switch (r.validation_status) {
        case ValidationStatus::Valid:
            ++stats.valid;
            break;
        case ValidationStatus::NeedsTranslation:
            ++stats.needs_translation;
            break;
        case ValidationStatus::Unsupported:
            ++stats.unsupported;
            break;
        case ValidationStatus::Error:
            ++stats.errors;
            break;
        case ValidationStatus::Unknown:
            break;
        }

        switch (r.translation_status) {
        case TranslationStatus::Translated:
            ++stats.translated;
            break;
        case TranslationStatus::Failed:
            ++stats.translation_failed;
            break;
        case TranslationStatus::NotApplicable:
        case TranslationStatus::Error:
            break;
        }

        switch (r.error_kind) {
        case ErrorKind::Validation:
            ++stats.validation_errors;
            break;
        case ErrorKind::Translation:
            ++stats.translation_errors;
            break;
        case ErrorKind::Worker:
            ++stats.worker_failures;
            break;
        case ErrorKind::None:
            break;
        }

        if (r.included) {
            ++stats.included;
        } else {
            ++stats.excluded;
        }
    }

    return stats;
}

// ============================================================================
// process_all
// ============================================================================

ProcessResult process_all(std::vector<rule::RuleRecord> records, const rule::SyntaxDatabase& db,
                          const ProcessOptions& options, output::Writer& log) {
    const auto started = std::chrono::steady_clock::now();

    // Диспетчеризуются только правила
    std::vector<RuleRecord> units;
    std::vector<RuleRecord> passthrough;
    units.reserve(records.size());
    for (auto& r : records) {
        if (r.kind == RecordKind::Rule) {
            units.push_back(std::move(r));
        } else {
            passthrough.push_back(std::move(r));
        }
    }
    records.clear();

    const UnitFn unit = options.unit ? options.unit : UnitFn(process_one);
    const std::size_t total = units.size();

    std::size_t workers = options.workers == 0 ? platform::hardware_threads() : options.workers;
    const std::size_t workers_used = std::min(workers, total);

    ProcessResult result;
    result.records.reserve(total + passthrough.size());

    std::atomic<std::size_t> next_index{0};
    std::atomic<bool> stop{false};
    std::mutex completion_mutex;
    std::size_t completed = 0;

    log.debug("processing " + std::to_string(total) + " rules with " +
              std::to_string(workers_used) + " workers, strategy " +
              rule::to_string(options.strategy));

    if (total > 0) {
        log.progress_begin("Processing rules", total);
    }

    // Прогресс не влияет на результат: сбой уведомления только журналируется
    bool progress_failed = false;
    auto notify_progress = [&](std::size_t done_count) {
        if (progress_failed) {
            return;
        }
        try {
            log.progress_tick(done_count);
            if (options.on_progress) {
                options.on_progress(done_count, total);
            }
        } catch (const std::exception& ex) {
            progress_failed = true;
            log.warn(std::string("progress reporting disabled: ") + ex.what());
        } catch (...) {
            progress_failed = true;
            log.warn("progress reporting disabled: unknown exception");
        }
    };

    auto worker_fn = [&]() {
        while (!stop.load(std::memory_order_relaxed)) {
            const std::size_t index = next_index.fetch_add(1, std::memory_order_relaxed);
            if (index >= total) {
                return;
            }

            RuleRecord done;
            std::string failure;
            try {
                done = unit(units[index], db, options.strategy);
            } catch (const std::exception& ex) {
                failure = std::string("worker failure: ") + ex.what();
            } catch (...) {
                failure = "worker failure: unknown exception";
            }
            if (!failure.empty()) {
                done = units[index];
                rule::mark_failed(done, ErrorKind::Worker, failure);
            }

            std::lock_guard<std::mutex> lock(completion_mutex);
            if (!failure.empty()) {
                log.debug(done.list_name + ":" + std::to_string(done.line_number) + ": " +
                          failure);
            }
            result.records.push_back(std::move(done));
            ++completed;

            const bool interval_hit =
                options.progress_interval > 0 && completed % options.progress_interval == 0;
            if (interval_hit || completed == total) {
                notify_progress(completed);
            }
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers_used);
    try {
        for (std::size_t i = 0; i < workers_used; ++i) {
            pool.emplace_back(worker_fn);
        }
    } catch (const std::system_error& ex) {
        stop.store(true, std::memory_order_relaxed);
        for (auto& t : pool) {
            t.join();
        }
        log.progress_end();
        log.debug(std::string("worker pool stopped after ") + std::to_string(pool.size()) +
                  " threads: " + ex.what());
        throw;
    }

    for (auto& t : pool) {
        t.join();
    }

    if (total > 0) {
        log.progress_end();
    }

    for (auto& r : passthrough) {
        result.records.push_back(std::move(r));
    }

    result.stats = collect_stats(result.records);
    result.stats.workers_used = workers_used;
    result.stats.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    log.debug("processed " + std::to_string(result.stats.rules) + " rules in " +
              std::to_string(result.stats.wall_time.count()) + " ms");

    return result;
}

}  // namespace unifilter::process
