#pragma once

/// @file include/trainlog/reducer.hpp
/// @brief Best-Per-Group Reducer: streaming arg-max per grouping key.
///
/// # Module: Best-Per-Group Reducer
///
/// ## Responsibility
/// Consume a stream of records and keep, per key, the single record with the
/// highest rank seen so far. `finalize()` emits one record per key in key
/// order.
///
/// ## Policy
/// The grouping rule is a policy type providing:
///
///   - `key_type`                          key stored per group (hashable)
///   - `key_of(const Record&)`             grouping key of a record
///   - `rank_of(const Record&)`            value being maximised
///   - `replaces(double in, double stored)` tie-break: should `in` win?
///   - `key_less(const key_type&, const key_type&)` finalize order
///
/// `MaxReturnPerEpisode` is the training-log rule: key = Episode, rank = Ret,
/// replace only on strictly greater Ret (first record wins ties), order by
/// numeric episode.
///
/// ## Guarantees
/// - Memory is O(distinct keys), independent of stream length
/// - Deterministic: the same update sequence gives the same result
/// - `finalize()` is stable: keys equal under `key_less` keep first-seen order

#include "trainlog/types.hpp"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trainlog::reduce {

// ─── MaxReturnPerEpisode ──────────────────────────────────────────────────────

/// Keep the highest-Ret record of each episode; first-seen wins ties.
struct MaxReturnPerEpisode {
    using key_type = std::string;

    [[nodiscard]] static const key_type& key_of(const LogRecord& r) noexcept {
        return r.episode;
    }

    [[nodiscard]] static double rank_of(const LogRecord& r) noexcept {
        return r.ret;
    }

    [[nodiscard]] static bool replaces(double incoming, double stored) noexcept {
        return incoming > stored;
    }

    [[nodiscard]] static bool key_less(const key_type& a, const key_type& b) noexcept {
        return compare_episode_ids(a, b) < 0;
    }
};

// ─── BestPerGroup ─────────────────────────────────────────────────────────────

/// Streaming best-record-per-key table.
template <typename Record, typename Policy>
class BestPerGroup {
public:
    using key_type = typename Policy::key_type;

    /// Offer one record. Stores it if its key is new or if
    /// `Policy::replaces(rank_of(record), stored rank)` holds.
    void update(const Record& record) {
        ++updates_;
        offer(Policy::rank_of(record), record);
    }

    /// Fold in a partial table built from records observed after this one's.
    ///
    /// Equivalent to replaying `other`'s surviving records, in its first-seen
    /// order, through `update`. Used to combine per-file states.
    void merge(const BestPerGroup& other) {
        for (const auto& entry : other.entries_) {
            offer(entry.rank, entry.record);
        }
        updates_ += other.updates_;
    }

    /// The best records, one per key, ordered by `Policy::key_less`.
    [[nodiscard]] std::vector<Record> finalize() const {
        std::vector<std::size_t> order(entries_.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(),
            [this](std::size_t a, std::size_t b) {
                return Policy::key_less(Policy::key_of(entries_[a].record),
                                        Policy::key_of(entries_[b].record));
            });

        std::vector<Record> out;
        out.reserve(order.size());
        for (const std::size_t i : order) {
            out.push_back(entries_[i].record);
        }
        return out;
    }

    /// Current best record for `key`, if any.
    [[nodiscard]] std::optional<Record> best_for(const key_type& key) const {
        const auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;
        return entries_[it->second].record;
    }

    /// Number of distinct keys seen.
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// Number of records offered, including those folded in by `merge`.
    [[nodiscard]] std::size_t updates() const noexcept { return updates_; }

    void reset() noexcept {
        entries_.clear();
        index_.clear();
        updates_ = 0;
    }

private:
    struct Entry {
        double rank;
        Record record;
    };

    void offer(double rank, const Record& record) {
        const auto& key = Policy::key_of(record);
        const auto it = index_.find(key);
        if (it == index_.end()) {
            index_.emplace(key, entries_.size());
            entries_.push_back(Entry{rank, record});
            return;
        }
        Entry& stored = entries_[it->second];
        if (Policy::replaces(rank, stored.rank)) {
            stored.rank   = rank;
            stored.record = record;
        }
    }

    std::vector<Entry>                         entries_;  ///< First-seen order
    std::unordered_map<key_type, std::size_t>  index_;    ///< key → entries_ slot
    std::size_t                                updates_{0};
};

/// The best-per-episode table built by the orchestrator.
using BestPerEpisode = BestPerGroup<LogRecord, MaxReturnPerEpisode>;

} // namespace trainlog::reduce
