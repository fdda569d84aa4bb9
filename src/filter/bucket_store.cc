#include <algorithm>
#include <stdexcept>
#include <string>

#include "bucket_store.h"

namespace probset::filter
{
    bucket_store::bucket_store(uint64_t size) : _buckets(size, empty_bucket())
    {
    }

    bucket_store bucket_store::from_buckets(std::vector<bucket> buckets)
    {
        bucket_store store{};
        store._buckets = std::move(buckets);
        return store;
    }

    const bucket& bucket_store::at(uint64_t idx) const
    {
        if(idx >= this->_buckets.size())
            throw std::out_of_range("bucket index " + std::to_string(idx) + " out of range [0, " + std::to_string(this->_buckets.size()) + ")");

        return this->_buckets[idx];
    }

    void bucket_store::replace_at(uint64_t idx, const bucket& b)
    {
        if(idx >= this->_buckets.size())
            throw std::out_of_range("bucket index " + std::to_string(idx) + " out of range [0, " + std::to_string(this->_buckets.size()) + ")");

        this->_buckets[idx] = b;
    }

    probset::status bucket_store::insert_at(uint64_t idx, const bucket& b)
    {
        // Locate the empty bucket that will absorb the shift before touching anything
        uint64_t empty_idx = idx;
        uint64_t steps = 0;

        while(!this->at(empty_idx).is_empty())
        {
            empty_idx = this->next(empty_idx);

            if(++steps == this->size())
                return probset::error("No empty bucket left to shift into", errc::FILTER_FULL);
        }

        // Walk back from the hole, moving each entry one slot to the right
        for(uint64_t i = empty_idx; i != idx;)
        {
            uint64_t p = this->prev(i);

            bucket relocated = this->_buckets[p]
                                   .with_flag(bucket_flag::IS_SHIFTED, true)
                                   .with_flag(bucket_flag::IS_OCCUPIED, this->_buckets[i].is_occupied());

            this->replace_at(i, relocated);
            i = p;
        }

        this->replace_at(idx, b.with_flag(bucket_flag::IS_OCCUPIED, this->_buckets[idx].is_occupied()));

        return probset::ok();
    }

    void bucket_store::remove_at(uint64_t idx, uint64_t canonical)
    {
        uint64_t s = idx;
        uint64_t sp = this->next(s);
        uint64_t quot = canonical;
        const uint64_t orig = idx;

        while(true)
        {
            const bucket next = this->at(sp);
            const bool curr_occupied = this->at(s).is_occupied();

            if(next.is_empty() || next.is_cluster_start() || sp == orig)
            {
                this->replace_at(s, this->at(s).vacated());
                return;
            }

            bucket moved = next;

            // A run head moving left may land on its own canonical slot
            if(next.is_run_start())
            {
                do
                {
                    quot = this->next(quot);
                } while(!this->at(quot).is_occupied());

                if(quot == s)
                    moved = moved.with_flag(bucket_flag::IS_SHIFTED, false);
            }

            this->replace_at(s, moved.with_flag(bucket_flag::IS_OCCUPIED, curr_occupied));

            s = sp;
            sp = this->next(sp);
        }
    }

    void bucket_store::clear()
    {
        std::fill(this->_buckets.begin(), this->_buckets.end(), empty_bucket());
    }

    uint64_t bucket_store::count_entries() const
    {
        return std::count_if(this->_buckets.begin(), this->_buckets.end(), [](const bucket& b)
                             { return !b.is_empty(); });
    }

} // namespace probset::filter
