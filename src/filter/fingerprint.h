#pragma once

#include <cstdint>
#include <utility>

namespace probset::filter
{
    /**
     * @brief Splits `fingerprint` into its quotient (high `num_q_bits`) and remainder (low `num_total_bits - num_q_bits`).
     * @details Quotienting technique: `f_r = f mod 2^r`, `f_q = f div 2^r`.
     * The fingerprint is masked to `num_total_bits` first, so bits above the fingerprint width are ignored.
     * @return {f_q, f_r}
     */
    std::pair<uint64_t, uint64_t> quotient(uint64_t fingerprint, uint32_t num_total_bits, uint32_t num_q_bits);

    /** @brief Reduces an arbitrary width hash to an `n` bit fingerprint (hash mod 2^n). */
    uint64_t fingerprint_from_hash(uint64_t hash, uint32_t n);

    /** @brief Mask with the low `bits` bits set; handles the full 64 bit width. */
    constexpr uint64_t low_bits_mask(uint32_t bits)
    {
        return bits >= 64 ? ~0ULL : (1ULL << bits) - 1;
    }

    struct fingerprint_parts
    {
        uint64_t quotient{};
        uint64_t remainder{};

        bool operator==(const fingerprint_parts&) const = default;
    };

    /**
     * @brief Fingerprint codec bound to a fixed `(n, q)` pair.
     * @details Holds the widths of one filter instance and converts hashes to
     * (quotient, remainder) pairs and back.
     */
    class fingerprint_codec
    {
        uint32_t _total_bits{};
        uint32_t _quotient_bits{};

    public:
        fingerprint_codec() = default;
        fingerprint_codec(uint32_t total_bits, uint32_t quotient_bits) : _total_bits(total_bits), _quotient_bits(quotient_bits) {}

        [[nodiscard]] fingerprint_parts split(uint64_t fingerprint) const
        {
            auto [f_q, f_r] = quotient(fingerprint, this->_total_bits, this->_quotient_bits);
            return {f_q, f_r};
        }

        [[nodiscard]] fingerprint_parts from_hash(uint64_t hash) const
        {
            return this->split(fingerprint_from_hash(hash, this->_total_bits));
        }

        [[nodiscard]] uint64_t join(const fingerprint_parts& parts) const
        {
            return (parts.quotient << this->remainder_bits()) | parts.remainder;
        }

        [[nodiscard]] uint32_t total_bits() const { return this->_total_bits; }
        [[nodiscard]] uint32_t quotient_bits() const { return this->_quotient_bits; }
        [[nodiscard]] uint32_t remainder_bits() const { return this->_total_bits - this->_quotient_bits; }
        [[nodiscard]] uint64_t num_buckets() const { return 1ULL << this->_quotient_bits; }
    };

} // namespace probset::filter
