#include <algorithm>
#include <bit>
#include <cmath>
#include <limits>
#include <numeric>
#include <string>

#include "bloom_filter.h"

namespace probset::filter
{
    probset::expected<bloom_filter> bloom_filter::make(const bloom_config& config)
    {
        if(config.num_bits == 0)
            return probset::error("num_bits must be > 0", errc::INVALID_CONFIGURATION);

        if(config.hashers.empty())
            return probset::error("At least one hash function is required", errc::INVALID_CONFIGURATION);

        if(!std::all_of(config.hashers.begin(), config.hashers.end(), [](const hash::hash_function& h)
                        { return h.valid(); }))
            return probset::error("Invalid hash function in configuration", errc::INVALID_CONFIGURATION);

        if(config.strategy == bloom_hashing::KIRSCH_MITZENMACHER)
        {
            if(config.hashers.size() != 2)
                return probset::error("Kirsch-Mitzenmacher hashing needs exactly two hash functions, got " + std::to_string(config.hashers.size()),
                                      errc::INVALID_CONFIGURATION);

            if(config.num_hashes == 0)
                return probset::error("num_hashes must be > 0", errc::INVALID_CONFIGURATION);
        }

        bloom_filter bf{};
        bf._config = config;
        bf._words.assign((config.num_bits + WORD_BITS - 1) / WORD_BITS, 0);

        bf._logger.log("Created filter with ", config.num_bits, " bits, k=", bf.num_hashes());

        return bf;
    }

    size_t bloom_filter::num_hashes() const
    {
        if(this->_config.strategy == bloom_hashing::KIRSCH_MITZENMACHER)
            return this->_config.num_hashes;

        return this->_config.hashers.size();
    }

    std::vector<size_t> bloom_filter::positions(std::span<const uint8_t> key) const
    {
        const size_t m = this->_config.num_bits;
        std::vector<size_t> result;
        result.reserve(this->num_hashes());

        if(this->_config.strategy == bloom_hashing::KIRSCH_MITZENMACHER)
        {
            // g_i(x) = h1(x) + i * h2(x), reduced mod m at every step to stay within 64 bits
            const uint64_t h1 = this->_config.hashers[0](key) % m;
            const uint64_t h2 = this->_config.hashers[1](key) % m;

            uint64_t g = h1;
            for(size_t i = 0; i < this->_config.num_hashes; ++i)
            {
                result.push_back(g);
                g = (g + h2) % m;
            }

            return result;
        }

        for(const auto& hasher : this->_config.hashers)
            result.push_back(hasher(key) % m);

        return result;
    }

    void bloom_filter::add(std::span<const uint8_t> key)
    {
        for(size_t idx : this->positions(key))
            this->_set_bit(idx);
    }

    void bloom_filter::add(std::string_view key)
    {
        this->add(hash::as_bytes(key));
    }

    bool bloom_filter::may_contain(std::span<const uint8_t> key) const
    {
        auto idxs = this->positions(key);
        return std::all_of(idxs.begin(), idxs.end(), [this](size_t idx)
                           { return this->test_bit(idx); });
    }

    bool bloom_filter::may_contain(std::string_view key) const
    {
        return this->may_contain(hash::as_bytes(key));
    }

    bool bloom_filter::test_bit(size_t idx) const
    {
        return (this->_words[idx / WORD_BITS] >> (idx % WORD_BITS)) & 1ULL;
    }

    probset::status bloom_filter::merge(const bloom_filter& other)
    {
        const auto same_hashers = std::equal(this->_config.hashers.begin(), this->_config.hashers.end(),
                                             other._config.hashers.begin(), other._config.hashers.end(),
                                             [](const hash::hash_function& a, const hash::hash_function& b)
                                             { return a.name == b.name && a.fn == b.fn; });

        if(this->_config.num_bits != other._config.num_bits ||
           this->_config.strategy != other._config.strategy ||
           this->num_hashes() != other.num_hashes() ||
           !same_hashers)
            return probset::error("Cannot merge bloom filters with different size or hashing", errc::INVALID_CONFIGURATION);

        for(size_t i = 0; i < this->_words.size(); ++i)
            this->_words[i] |= other._words[i];

        this->_logger.log("Merged filter, bits set: ", this->bits_set());

        return probset::ok();
    }

    size_t bloom_filter::bits_set() const
    {
        return std::accumulate(this->_words.begin(), this->_words.end(), size_t{0}, [](size_t acc, uint64_t word)
                               { return acc + std::popcount(word); });
    }

    double bloom_filter::estimate_cardinality() const
    {
        const auto m = static_cast<double>(this->_config.num_bits);
        const auto x = static_cast<double>(this->bits_set());

        if(x >= m)
            return std::numeric_limits<double>::infinity();

        return -m * std::log(1.0 - x / m);
    }

    void bloom_filter::clear()
    {
        std::fill(this->_words.begin(), this->_words.end(), 0);
    }

} // namespace probset::filter
