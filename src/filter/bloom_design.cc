#include <cmath>
#include <numbers>
#include <stdexcept>

#include "bloom_design.h"

namespace probset::filter::bloom_design
{
    double p_false_positive(size_t n, size_t m, size_t k)
    {
        if(m == 0)
            throw std::invalid_argument("m must be > 0");

        const double kd = static_cast<double>(k);
        return std::pow(1.0 - std::exp(-kd * static_cast<double>(n) / static_cast<double>(m)), kd);
    }

    size_t filter_length(double p_fp, size_t n)
    {
        if(p_fp <= 0.0 || p_fp >= 1.0)
            throw std::invalid_argument("p_fp must be in (0, 1)");

        const double ln2 = std::numbers::ln2;
        return static_cast<size_t>(std::llround(-static_cast<double>(n) * std::log(p_fp) / (ln2 * ln2)));
    }

    size_t optimal_k(size_t n, size_t m)
    {
        if(n == 0)
            throw std::invalid_argument("n must be > 0");

        return static_cast<size_t>(std::trunc(static_cast<double>(m) / static_cast<double>(n) * std::numbers::ln2));
    }

} // namespace probset::filter::bloom_design
