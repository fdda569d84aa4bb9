#include "fingerprint.h"

namespace probset::filter
{
    std::pair<uint64_t, uint64_t> quotient(uint64_t fingerprint, uint32_t num_total_bits, uint32_t num_q_bits)
    {
        const uint64_t f = fingerprint & low_bits_mask(num_total_bits);
        const uint32_t r = num_total_bits - num_q_bits;

        const uint64_t f_r = f & low_bits_mask(r);
        const uint64_t f_q = r >= 64 ? 0 : f >> r;

        return {f_q, f_r};
    }

    uint64_t fingerprint_from_hash(uint64_t hash, uint32_t n)
    {
        return hash & low_bits_mask(n);
    }
} // namespace probset::filter
