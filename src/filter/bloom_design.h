#pragma once

#include <cstddef>

/*
    Sizing helpers for the bloom filter.

    m: length of the filter (bits)
    n: expected number of keys added
    k: number of hash functions

    m has to be large compared to n, and must grow linearly with n to keep a target false positive rate.
*/

namespace probset::filter::bloom_design
{
    // Lower bound of the false positive probability: (1 - e^(-k n / m))^k
    double p_false_positive(size_t n, size_t m, size_t k);

    // Filter length for a target false positive probability: round(-n ln(p) / ln(2)^2)
    size_t filter_length(double p_fp, size_t n);

    // k minimizing the false positive probability for a given m / n, truncated since k is an integer
    size_t optimal_k(size_t n, size_t m);

} // namespace probset::filter::bloom_design
