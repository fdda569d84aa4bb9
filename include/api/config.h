#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "hash.h"

namespace probset
{
    struct filter_config
    {
        uint32_t fingerprint_bits = 32;                 // n: fingerprint width, the remainder gets n - q bits
        uint32_t quotient_bits = 16;                    // q: the bucket array holds 2^q buckets
        hash::hash_function hasher = hash::murmur3();   // must produce at least fingerprint_bits bits
    };

    enum class bloom_hashing
    {
        HASH_LIST,          // every hash function in `hashers` sets one bit
        KIRSCH_MITZENMACHER // k bits from h1 + i * h2, requires exactly two hashers
    };

    struct bloom_config
    {
        size_t num_bits = 1024;                                                  // m: length of the bit array
        std::vector<hash::hash_function> hashers{hash::murmur3(), hash::fnv1a32()}; // independent hash functions
        bloom_hashing strategy = bloom_hashing::HASH_LIST;                       // how bit positions are derived
        size_t num_hashes = 2;                                                   // k, only read by KIRSCH_MITZENMACHER
    };
} // namespace probset
