#include <bit>
#include <string>

#include <error.hpp>

#include "quotient_filter.h"

namespace probset::filter
{
    probset::status quotient_filter::_validate(const filter_config& config)
    {
        if(config.quotient_bits == 0)
            return probset::error("quotient_bits must be > 0", errc::INVALID_CONFIGURATION);

        if(config.quotient_bits >= config.fingerprint_bits)
            return probset::error("quotient_bits (" + std::to_string(config.quotient_bits) + ") must be < fingerprint_bits (" + std::to_string(config.fingerprint_bits) + ")",
                                  errc::INVALID_CONFIGURATION);

        if(config.fingerprint_bits > MAX_FINGERPRINT_BITS)
            return probset::error("fingerprint_bits must be <= " + std::to_string(MAX_FINGERPRINT_BITS), errc::INVALID_CONFIGURATION);

        if(config.quotient_bits > MAX_QUOTIENT_BITS)
            return probset::error("quotient_bits must be <= " + std::to_string(MAX_QUOTIENT_BITS), errc::INVALID_CONFIGURATION);

        if(!config.hasher.valid())
            return probset::error("A valid hash function is required", errc::INVALID_CONFIGURATION);

        if(config.hasher.bits < config.fingerprint_bits)
            return probset::error("Hash function " + config.hasher.name + " produces " + std::to_string(config.hasher.bits) + " bits, fewer than fingerprint_bits (" +
                                      std::to_string(config.fingerprint_bits) + ")",
                                  errc::INVALID_CONFIGURATION);

        return probset::ok();
    }

    probset::expected<quotient_filter> quotient_filter::make(const filter_config& config)
    {
        if(auto status = _validate(config); !status)
            return status.error();

        quotient_filter qf{};
        qf._config = config;
        qf._codec = fingerprint_codec(config.fingerprint_bits, config.quotient_bits);
        qf._store = bucket_store(qf._codec.num_buckets());

        qf._logger.log("Created filter with ", qf.num_buckets(), " buckets, q=", config.quotient_bits, " r=", qf.remainder_bits(), " hash=", config.hasher.name);

        return qf;
    }

    probset::expected<quotient_filter> quotient_filter::make(uint32_t fingerprint_bits, uint32_t quotient_bits)
    {
        filter_config config{};
        config.fingerprint_bits = fingerprint_bits;
        config.quotient_bits = quotient_bits;

        return make(config);
    }

    probset::expected<quotient_filter> quotient_filter::make_with_buckets(uint64_t num_buckets, uint32_t fingerprint_bits)
    {
        if(num_buckets < 2 || !std::has_single_bit(num_buckets))
            return probset::error("num_buckets must be a power of two >= 2, got " + std::to_string(num_buckets), errc::INVALID_CONFIGURATION);

        return make(fingerprint_bits, static_cast<uint32_t>(std::countr_zero(num_buckets)));
    }

    probset::status quotient_filter::insert(std::span<const uint8_t> key)
    {
        return this->insert_fingerprint(this->fingerprint_of(key));
    }

    probset::status quotient_filter::insert(std::string_view key)
    {
        return this->insert(hash::as_bytes(key));
    }

    probset::status quotient_filter::insert_fingerprint(uint64_t fingerprint)
    {
        if(this->_size >= this->capacity())
        {
            this->_logger.log_always("Rejected insert: filter full with ", this->_size, " entries");
            return probset::error("Quotient filter is full (" + std::to_string(this->_size) + " entries)", errc::FILTER_FULL);
        }

        auto [f_q, f_r] = this->_codec.split(fingerprint);

        const bucket canonical = this->_store.at(f_q);

        // Fast path: the canonical bucket is free
        if(canonical.is_empty())
        {
            this->_store.replace_at(f_q, bucket{f_r}.with_flag(bucket_flag::IS_OCCUPIED, true));
            ++this->_size;
            return probset::ok();
        }

        const bool run_exists = canonical.is_occupied();

        // Must be set before scanning, the scan counts occupied buckets to find the run
        if(!run_exists)
            this->_store.set_flag_at(f_q, bucket_flag::IS_OCCUPIED, true);

        auto [r_start, r_end] = scan_for_run(this->_store, f_q);

        bucket entry{f_r};
        uint64_t s = r_start;

        if(run_exists)
        {
            // Keep the run sorted, equal remainders go after the existing ones
            while(s != r_end && this->_store.at(s).remainder() <= f_r)
                s = this->_store.next(s);

            if(s == r_start)
                this->_store.set_flag_at(r_start, bucket_flag::IS_CONTINUATION, true); // the old head is now second
            else
                entry = entry.with_flag(bucket_flag::IS_CONTINUATION, true);
        }

        if(s != f_q)
            entry = entry.with_flag(bucket_flag::IS_SHIFTED, true);

        if(auto status = this->_store.insert_at(s, entry); !status)
        {
            // Unreachable while the load counter is right; undo the flag changes so the filter stays consistent
            if(run_exists && s == r_start)
                this->_store.set_flag_at(r_start, bucket_flag::IS_CONTINUATION, false);
            if(!run_exists)
                this->_store.set_flag_at(f_q, bucket_flag::IS_OCCUPIED, false);

            return probset::error("Failed to insert fingerprint: " + status.error().to_string(), errc::FILTER_FULL);
        }

        ++this->_size;
        return probset::ok();
    }

    bool quotient_filter::may_contain(std::span<const uint8_t> key) const
    {
        return this->contains_fingerprint(this->fingerprint_of(key));
    }

    bool quotient_filter::may_contain(std::string_view key) const
    {
        return this->may_contain(hash::as_bytes(key));
    }

    bool quotient_filter::contains_fingerprint(uint64_t fingerprint) const
    {
        auto [f_q, f_r] = this->_codec.split(fingerprint);

        // An unset occupied bit proves absence
        if(!this->_store.at(f_q).is_occupied())
            return false;

        auto [r_start, r_end] = scan_for_run(this->_store, f_q);

        for(uint64_t s = r_start; s != r_end; s = this->_store.next(s))
        {
            const uint64_t remainder = this->_store.at(s).remainder();

            if(remainder == f_r)
                return true;

            // runs are sorted
            if(remainder > f_r)
                return false;
        }

        return false;
    }

    void quotient_filter::clear()
    {
        this->_store.clear();
        this->_size = 0;

        this->_logger.log("Cleared filter");
    }

} // namespace probset::filter
