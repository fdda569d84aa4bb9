#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include <api/config.h>
#include <error.hpp>
#include <logger.h>

namespace probset::filter
{
    /**
     * @brief Classic bit-array Bloom filter.
     * @details A key sets one bit per hash position. Positions come either from every hash function
     * of the configuration (`HASH_LIST`) or from two hash functions combined with the
     * Kirsch–Mitzenmacher scheme `g_i(x) = h1(x) + i * h2(x) mod m` (`KIRSCH_MITZENMACHER`).
     * Lookups never return false negatives.
     */
    class bloom_filter
    {
        static constexpr size_t WORD_BITS = 64;

        bloom_config _config{};
        std::vector<uint64_t> _words;

        logger _logger{"bloom_filter"};

        bloom_filter() = default;

    public:
        /** @return INVALID_CONFIGURATION on zero bits, no (or invalid) hash functions, or a bad Kirsch–Mitzenmacher setup. */
        static probset::expected<bloom_filter> make(const bloom_config& config);

        bloom_filter(bloom_filter&& other) noexcept = default;
        bloom_filter& operator=(bloom_filter&& other) noexcept = default;

        bloom_filter(const bloom_filter& other) = delete;
        bloom_filter& operator=(const bloom_filter& other) = delete;

        void add(std::span<const uint8_t> key);
        void add(std::string_view key);

        [[nodiscard]] bool may_contain(std::span<const uint8_t> key) const;
        [[nodiscard]] bool may_contain(std::string_view key) const;

        /** @brief Bit indexes the key maps to, in hash order (may repeat). */
        [[nodiscard]] std::vector<size_t> positions(std::span<const uint8_t> key) const;

        /**
         * @brief Union with another filter (bitwise OR).
         * @return INVALID_CONFIGURATION unless both filters have the same size and hashing.
         */
        probset::status merge(const bloom_filter& other);

        [[nodiscard]] bool test_bit(size_t idx) const;

        /** @brief Number of bits set to 1. */
        [[nodiscard]] size_t bits_set() const;

        /**
         * @brief Linear Counting estimate of the number of distinct keys added: -m * ln(1 - X / m).
         * @details Returns +infinity once every bit is set.
         */
        [[nodiscard]] double estimate_cardinality() const;

        void clear();

        [[nodiscard]] size_t num_bits() const { return this->_config.num_bits; }
        [[nodiscard]] size_t num_hashes() const;

    private:
        void _set_bit(size_t idx)
        {
            this->_words[idx / WORD_BITS] |= 1ULL << (idx % WORD_BITS);
        }
    };

} // namespace probset::filter
