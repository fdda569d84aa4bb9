#pragma once

#include <cstdint>
#include <ostream>

#include "bucket_store.h"

namespace probset::filter
{
    /**
     * @brief Half-open range `[start, end)` of bucket indexes holding one run.
     * @details Indexes wrap around the bucket array, so `end` may be smaller than `start`.
     * An empty run has `start == end`.
     */
    struct run_bounds
    {
        uint64_t start{};
        uint64_t end{};

        [[nodiscard]] bool empty() const
        {
            return this->start == this->end;
        }

        bool operator==(const run_bounds&) const = default;
    };

    inline std::ostream& operator<<(std::ostream& os, const run_bounds& run)
    {
        return os << "[" << run.start << ", " << run.end << ")";
    }

    /**
     * @brief Walks backward from `f_q` while buckets are shifted.
     * @return The index of the first bucket of the cluster enclosing `f_q`.
     */
    uint64_t find_cluster_start(const bucket_store& store, uint64_t f_q);

    /**
     * @brief Locates the run that belongs to the canonical bucket `f_q`.
     * @details
     * 1. Find the cluster start by walking backward over shifted buckets.
     * 2. Walk forward from there with two cursors: the run cursor skips one whole run at a time,
     *    the canonical cursor moves to the next occupied bucket. They move in lockstep, one run per
     *    occupied canonical bucket, until the canonical cursor reaches `f_q`.
     * 3. The run ends at the first following bucket that is not a continuation.
     *
     * If `f_q` is not occupied the returned run is empty and `start` is where it would begin.
     * The store must keep at least one empty bucket, otherwise the walks do not terminate.
     */
    run_bounds scan_for_run(const bucket_store& store, uint64_t f_q);

} // namespace probset::filter
