#include "scan.h"

namespace probset::filter
{
    uint64_t find_cluster_start(const bucket_store& store, uint64_t f_q)
    {
        uint64_t idx = f_q;

        while(store.at(idx).is_shifted())
            idx = store.prev(idx);

        return idx;
    }

    run_bounds scan_for_run(const bucket_store& store, uint64_t f_q)
    {
        const bool occupied = store.at(f_q).is_occupied();

        uint64_t idx = find_cluster_start(store, f_q);
        uint64_t r_start = idx;

        while(idx != f_q)
        {
            // skip the continuation buckets of the current run
            do
            {
                r_start = store.next(r_start);
            } while(store.at(r_start).is_continuation());

            // next canonical bucket, never past f_q
            do
            {
                idx = store.next(idx);
            } while(!store.at(idx).is_occupied() && idx != f_q);
        }

        if(!occupied)
            return {r_start, r_start};

        uint64_t r_end = store.next(r_start);
        while(store.at(r_end).is_continuation())
            r_end = store.next(r_end);

        return {r_start, r_end};
    }

} // namespace probset::filter
