#pragma once

#include <cstdint>
#include <vector>

#include <error.hpp>

#include "bucket.h"

namespace probset::filter
{
    /**
     * @brief Fixed-length circular array of buckets, exclusively owned by one filter.
     * @details All index arithmetic wraps modulo `size()`. Reading an index outside
     * `[0, size())` is a programming error and throws `std::out_of_range`.
     * `replace_at` is the single point through which buckets are written; `insert_at`
     * and `remove_at` are built on top of it.
     */
    class bucket_store
    {
        std::vector<bucket> _buckets;

    public:
        bucket_store() = default;
        explicit bucket_store(uint64_t size);

        bucket_store(bucket_store&& other) noexcept = default;
        bucket_store& operator=(bucket_store&& other) noexcept = default;

        bucket_store(const bucket_store& other) = default;
        bucket_store& operator=(const bucket_store& other) = default;

        /** @brief Builds a store from an explicit list of buckets (e.g. a hand crafted layout). */
        static bucket_store from_buckets(std::vector<bucket> buckets);

        [[nodiscard]] uint64_t size() const
        {
            return this->_buckets.size();
        }

        [[nodiscard]] const bucket& at(uint64_t idx) const;

        void replace_at(uint64_t idx, const bucket& b);

        void set_flag_at(uint64_t idx, bucket_flag flag, bool value)
        {
            this->replace_at(idx, this->at(idx).with_flag(flag, value));
        }

        [[nodiscard]] uint64_t next(uint64_t idx) const
        {
            return idx + 1 == this->_buckets.size() ? 0 : idx + 1;
        }

        [[nodiscard]] uint64_t prev(uint64_t idx) const
        {
            return idx == 0 ? this->_buckets.size() - 1 : idx - 1;
        }

        /**
         * @brief Places `b` at `idx`, shifting the entries in `[idx, first empty)` one slot to the right.
         * @details Every relocated entry keeps its value and `is_continuation` bit and gets `is_shifted` set.
         * `is_occupied` stays with its slot: the bucket written at any index inherits that index's occupied bit,
         * whatever `b` or the relocated entry carried.
         * Fails with FILTER_FULL, leaving the store untouched, when there is no empty bucket to absorb the shift.
         */
        probset::status insert_at(uint64_t idx, const bucket& b);

        /**
         * @brief Removes the entry at `idx`, shifting the rest of its cluster one slot to the left.
         * @details `canonical` is the quotient the removed entry belongs to. The shift stops at an empty bucket
         * or at an entry sitting in its canonical slot. Entries that land back on their canonical slot
         * get `is_shifted` cleared. The caller fixes the flags of a run whose head was removed.
         */
        void remove_at(uint64_t idx, uint64_t canonical);

        void clear();

        [[nodiscard]] uint64_t count_entries() const;

        [[nodiscard]] std::vector<bucket>::const_iterator begin() const { return this->_buckets.begin(); }
        [[nodiscard]] std::vector<bucket>::const_iterator end() const { return this->_buckets.end(); }
    };

    inline bucket_store make_bucket_list(uint64_t size)
    {
        return bucket_store(size);
    }

} // namespace probset::filter
