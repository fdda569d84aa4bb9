#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <random>
#include <span>
#include <vector>

#include <uuid.h>

#include <api/config.h>
#include <filter/bloom_design.h>
#include <filter/bloom_filter.h>
#include <filter/quotient_filter.h>

// Utility struct to hold the example parameters and the generated keys
struct filter_example_util
{
    filter_example_util(uint32_t quotient_bits = 20,
                        uint32_t fingerprint_bits = 32,
                        double target_load = 0.75) : _quotient_bits(quotient_bits),
                                                     _fingerprint_bits(fingerprint_bits),
                                                     _n_keys(static_cast<size_t>(static_cast<double>(1ULL << quotient_bits) * target_load))
    {
        this->_uuids.reserve(this->_n_keys);
    }

    uint32_t _quotient_bits;    // 2^q buckets
    uint32_t _fingerprint_bits; // n, the remainder takes n - q bits
    size_t _n_keys;             // number of keys inserted
    size_t _n_probes = 1'000'000;

    // Runtime data
    std::vector<uuids::uuid> _uuids;
    size_t seed = 107279581;
    std::mt19937 _generator{seed};
    uuids::basic_uuid_random_generator<std::mt19937> gen{_generator};

    uuids::uuid generate_uuid()
    {
        // The uuids are stored for read-back verification
        this->_uuids.emplace_back(this->gen());
        return this->_uuids.back();
    }

    static std::span<const uint8_t> bytes(const uuids::uuid& uuid)
    {
        const auto& as_array = reinterpret_cast<const std::array<uint8_t, 16>&>(uuid);
        return {as_array.data(), as_array.size()};
    }
};

void print_metrics(const char* what, size_t n_items, std::chrono::microseconds duration)
{
    std::cout << "Total duration: " << (double)duration.count() / 1000.0 << " ms" << std::endl;
    std::cout << "Average duration per " << what << ": " << (double)duration.count() / n_items << " us" << std::endl;
    std::cout << what << " throughput: " << (uint64_t)(n_items / (double)duration.count() * 1'000'000) << " items/s" << std::endl;
}

int main()
{
    filter_example_util util(20,  // quotient bits
                             32,  // fingerprint bits
                             0.75 // target load
    );

    std::cout << "Starting filter example..." << std::endl;
    std::cout << "N_KEYS: " << util._n_keys << ", Q: " << util._quotient_bits << ", N: " << util._fingerprint_bits << std::endl;

    // --- 1. Filter Setup ---
    probset::filter_config config;
    config.fingerprint_bits = util._fingerprint_bits;
    config.quotient_bits = util._quotient_bits;

    auto maybe_qf = probset::filter::quotient_filter::make(config);
    if(!maybe_qf)
    {
        std::cerr << "FATAL: An error occurred while creating the filter: " << maybe_qf.error().to_string() << std::endl;
        exit(1);
    }

    auto qf = std::move(maybe_qf.value());
    std::cout << "Quotient filter created with " << qf.num_buckets() << " buckets, hash " << qf.hash_name() << std::endl;

    // --- 2. Insertion Test ---
    auto t0 = std::chrono::high_resolution_clock::now();
    for(size_t i = 0; i < util._n_keys; ++i)
    {
        auto key = util.generate_uuid();

        if(auto status = qf.insert(filter_example_util::bytes(key)); !status)
        {
            std::cerr << "FATAL: An error occurred during insertion: " << status.error().to_string() << std::endl;
            exit(1);
        }
    }
    auto t1 = std::chrono::high_resolution_clock::now();

    std::cout << "\n--- Insertion Metrics ---" << std::endl;
    print_metrics("insertion", util._n_keys, std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0));
    std::cout << "Load factor: " << qf.load_factor() << std::endl;

    // --- 3. Lookup Test ---
    size_t number_of_errors = 0;

    t0 = std::chrono::high_resolution_clock::now();
    for(const auto& key : util._uuids)
    {
        if(!qf.may_contain(filter_example_util::bytes(key)))
        {
            std::cerr << "False negative for key " << key << std::endl;
            number_of_errors++;
        }
    }
    t1 = std::chrono::high_resolution_clock::now();

    if(number_of_errors > 0)
    {
        std::cerr << "\nFATAL: " << number_of_errors << " false negatives." << std::endl;
        exit(1);
    }
    std::cout << "\nAll " << util._n_keys << " keys found." << std::endl;

    std::cout << "\n--- Lookup Metrics ---" << std::endl;
    print_metrics("lookup", util._n_keys, std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0));

    // --- 4. False Positives ---
    size_t qf_false_positives = 0;
    for(size_t i = 0; i < util._n_probes; ++i)
    {
        auto probe = util.gen();
        if(qf.may_contain(filter_example_util::bytes(probe)))
            qf_false_positives++;
    }

    std::cout << "\n--- False Positives ---" << std::endl;
    std::cout << "Quotient filter: " << (double)qf_false_positives / util._n_probes << " (" << qf_false_positives << "/" << util._n_probes << ")" << std::endl;

    // A bloom filter sized for the same rate, for comparison
    const double target_rate = std::max((double)qf_false_positives / util._n_probes, 1e-6);

    probset::bloom_config bloom_config;
    bloom_config.num_bits = probset::filter::bloom_design::filter_length(target_rate, util._n_keys);
    bloom_config.num_hashes = std::max<size_t>(1, probset::filter::bloom_design::optimal_k(util._n_keys, bloom_config.num_bits));
    bloom_config.strategy = probset::bloom_hashing::KIRSCH_MITZENMACHER;

    auto maybe_bf = probset::filter::bloom_filter::make(bloom_config);
    if(!maybe_bf)
    {
        std::cerr << "FATAL: An error occurred while creating the bloom filter: " << maybe_bf.error().to_string() << std::endl;
        exit(1);
    }

    auto bf = std::move(maybe_bf.value());
    for(const auto& key : util._uuids)
        bf.add(filter_example_util::bytes(key));

    size_t bf_false_positives = 0;
    for(size_t i = 0; i < util._n_probes; ++i)
    {
        auto probe = util.gen();
        if(bf.may_contain(filter_example_util::bytes(probe)))
            bf_false_positives++;
    }

    std::cout << "Bloom filter (m=" << bf.num_bits() << ", k=" << bf.num_hashes() << "): "
              << (double)bf_false_positives / util._n_probes << " (" << bf_false_positives << "/" << util._n_probes << ")" << std::endl;
    std::cout << "Bloom filter estimated cardinality: " << bf.estimate_cardinality() << std::endl;

    std::cout << "\n--- Space ---" << std::endl;
    std::cout << "Quotient filter: " << qf.num_buckets() * (qf.remainder_bits() + 3) / 8 / 1024 << " KiB (packed)" << std::endl;
    std::cout << "Bloom filter: " << bf.num_bits() / 8 / 1024 << " KiB" << std::endl;
}
