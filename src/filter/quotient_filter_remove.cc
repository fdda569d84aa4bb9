#include <error.hpp>

#include "quotient_filter.h"

// Deletion is kept apart from the core insert/lookup path: nothing in there depends on it.

namespace probset::filter
{
    probset::status quotient_filter::remove(std::span<const uint8_t> key)
    {
        return this->remove_fingerprint(this->fingerprint_of(key));
    }

    probset::status quotient_filter::remove(std::string_view key)
    {
        return this->remove(hash::as_bytes(key));
    }

    probset::status quotient_filter::remove_fingerprint(uint64_t fingerprint)
    {
        auto [f_q, f_r] = this->_codec.split(fingerprint);

        if(this->_size == 0 || !this->_store.at(f_q).is_occupied())
            return probset::error("Fingerprint not stored", errc::KEY_NOT_FOUND);

        auto [r_start, r_end] = scan_for_run(this->_store, f_q);

        uint64_t s = r_start;
        while(s != r_end && this->_store.at(s).remainder() < f_r)
            s = this->_store.next(s);

        if(s == r_end || this->_store.at(s).remainder() != f_r)
            return probset::error("Fingerprint not stored", errc::KEY_NOT_FOUND);

        const bool removing_run_head = (s == r_start);

        // Last entry of its run: the canonical bucket is no longer occupied
        if(removing_run_head && this->_store.next(s) == r_end)
            this->_store.set_flag_at(f_q, bucket_flag::IS_OCCUPIED, false);

        this->_store.remove_at(s, f_q);

        if(removing_run_head)
        {
            const bucket& head = this->_store.at(s);
            bucket updated = head;

            // The second entry of the run took the head's place
            if(updated.is_continuation())
                updated = updated.with_flag(bucket_flag::IS_CONTINUATION, false);

            if(s == f_q && updated.is_run_start())
                updated = updated.with_flag(bucket_flag::IS_SHIFTED, false);

            if(updated != head)
                this->_store.replace_at(s, updated);
        }

        --this->_size;
        return probset::ok();
    }

} // namespace probset::filter
