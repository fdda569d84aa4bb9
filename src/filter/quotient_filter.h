#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include <api/config.h>
#include <error.hpp>
#include <logger.h>

#include "bucket_store.h"
#include "fingerprint.h"
#include "scan.h"

namespace probset::filter
{
    /**
     * @brief Quotient filter: an approximate membership set stored in a single circular bucket array.
     * @details Each key is hashed to an `n` bit fingerprint; the high `q` bits select the canonical
     * bucket, the low `n - q` bits are stored. Entries that collide on a canonical bucket are kept
     * in sorted runs, and runs that collide on a slot are pushed right into clusters. Three metadata
     * bits per bucket make it possible to find any run from its canonical index.
     *
     * Membership queries never return false negatives. False positives happen when two keys share a fingerprint.
     *
     * The filter is not synchronized: wrap it in `async::rw_guard` to share it between threads.
     */
    class quotient_filter
    {
        friend struct QuotientFilterTest;

        static constexpr uint32_t MAX_FINGERPRINT_BITS = 64;
        static constexpr uint32_t MAX_QUOTIENT_BITS = 32;

        filter_config _config{};
        fingerprint_codec _codec{};
        bucket_store _store{};
        uint64_t _size{};

        logger _logger{"quotient_filter"};

        quotient_filter() = default;

    public:
        /**
         * @brief Creates an empty filter with 2^q buckets.
         * @return INVALID_CONFIGURATION if `q == 0`, `q >= n`, `n > 64`, `q > 32`,
         * or the hash function is narrower than `n` bits.
         */
        static probset::expected<quotient_filter> make(const filter_config& config);
        static probset::expected<quotient_filter> make(uint32_t fingerprint_bits, uint32_t quotient_bits);

        /** @brief Creates a filter with `num_buckets` buckets; `num_buckets` must be a power of two >= 2. */
        static probset::expected<quotient_filter> make_with_buckets(uint64_t num_buckets, uint32_t fingerprint_bits);

        quotient_filter(quotient_filter&& other) noexcept = default;
        quotient_filter& operator=(quotient_filter&& other) noexcept = default;

        quotient_filter(const quotient_filter& other) = delete;
        quotient_filter& operator=(const quotient_filter& other) = delete;

        ~quotient_filter() = default;

        /**
         * @brief Inserts a key.
         * @details Duplicates are kept: inserting the same key twice stores two entries.
         * @return FILTER_FULL if the filter already holds `capacity()` entries; the filter is left untouched.
         */
        probset::status insert(std::span<const uint8_t> key);
        probset::status insert(std::string_view key);

        /** @brief Inserts an already computed fingerprint (only its low `n` bits are used). */
        probset::status insert_fingerprint(uint64_t fingerprint);

        /** @brief Returns false only if the key was never inserted. */
        [[nodiscard]] bool may_contain(std::span<const uint8_t> key) const;
        [[nodiscard]] bool may_contain(std::string_view key) const;
        [[nodiscard]] bool contains_fingerprint(uint64_t fingerprint) const;

        /**
         * @brief Removes one stored copy of the key's fingerprint.
         * @details Deleting a key that was never inserted but collides with a stored one removes the
         * other key's fingerprint and creates a false negative for it: only remove keys known to be present.
         * @return KEY_NOT_FOUND if the fingerprint is not stored.
         */
        probset::status remove(std::span<const uint8_t> key);
        probset::status remove(std::string_view key);
        probset::status remove_fingerprint(uint64_t fingerprint);

        /** @brief Empties the filter, keeping its allocation. */
        void clear();

        [[nodiscard]] uint64_t fingerprint_of(std::span<const uint8_t> key) const
        {
            return fingerprint_from_hash(this->_config.hasher(key), this->_codec.total_bits());
        }

        /** @brief Bounds of the run stored for canonical bucket `f_q` (empty if there is none). */
        [[nodiscard]] run_bounds find_run(uint64_t f_q) const
        {
            return scan_for_run(this->_store, f_q);
        }

        [[nodiscard]] uint64_t size() const { return this->_size; }
        [[nodiscard]] bool empty() const { return this->_size == 0; }
        [[nodiscard]] uint64_t num_buckets() const { return this->_store.size(); }

        /** @brief One bucket is always kept empty so that the run scans terminate. */
        [[nodiscard]] uint64_t capacity() const { return this->_store.size() - 1; }

        [[nodiscard]] double load_factor() const
        {
            return static_cast<double>(this->_size) / static_cast<double>(this->_store.size());
        }

        [[nodiscard]] const fingerprint_codec& codec() const { return this->_codec; }
        [[nodiscard]] uint32_t quotient_bits() const { return this->_codec.quotient_bits(); }
        [[nodiscard]] uint32_t remainder_bits() const { return this->_codec.remainder_bits(); }
        [[nodiscard]] const std::string& hash_name() const { return this->_config.hasher.name; }

    private:
        static probset::status _validate(const filter_config& config);
    };

} // namespace probset::filter
