#pragma once

#include <cstdint>
#include <limits>
#include <ostream>

namespace probset::filter
{
    enum class bucket_flag : uint8_t
    {
        IS_SHIFTED = 0b001,
        IS_CONTINUATION = 0b010,
        IS_OCCUPIED = 0b100,
    };

    /**
     * @brief A single slot of the quotient filter.
     * @details Layout mirrors the textbook `<<is_occupied::1, is_continuation::1, is_shifted::1>>` triple:
     * bit 2 of `_metadata` is `is_occupied`, bit 1 `is_continuation`, bit 0 `is_shifted`.
     * The upper five bits are unused but are carried along untouched by `with_flag`.
     *
     * - `is_occupied` belongs to the slot: it says that some stored remainder has this index as
     *   its canonical bucket, wherever that remainder ended up.
     * - `is_continuation` belongs to the entry: it is not the first entry of its run.
     * - `is_shifted` belongs to the entry: it is not stored in its canonical bucket.
     *
     * The stored remainder is at most 63 bits wide, so the all-ones value is used as the empty sentinel.
     * Size is 16 bytes total.
     */
    class bucket
    {
    public:
        static constexpr uint64_t EMPTY = std::numeric_limits<uint64_t>::max();

    private:
        uint64_t _value{EMPTY}; ///< Stored remainder, or EMPTY.
        uint8_t _metadata{};    ///< Packed flags, see bucket_flag.

    public:
        bucket() = default;

        explicit bucket(uint64_t remainder, uint8_t metadata = 0) : _value(remainder), _metadata(metadata) {}

        /** @brief Builds the raw metadata byte from the three flags. */
        static constexpr uint8_t flags(bool is_occupied, bool is_continuation, bool is_shifted)
        {
            return static_cast<uint8_t>((is_occupied ? 0b100 : 0) | (is_continuation ? 0b010 : 0) | (is_shifted ? 0b001 : 0));
        }

        [[nodiscard]] bool is_empty() const
        {
            return this->_value == EMPTY;
        }

        [[nodiscard]] uint64_t remainder() const
        {
            return this->_value;
        }

        [[nodiscard]] uint8_t metadata() const
        {
            return this->_metadata;
        }

        [[nodiscard]] bool test(bucket_flag flag) const
        {
            return (this->_metadata & static_cast<uint8_t>(flag)) != 0;
        }

        [[nodiscard]] bool is_occupied() const { return this->test(bucket_flag::IS_OCCUPIED); }
        [[nodiscard]] bool is_continuation() const { return this->test(bucket_flag::IS_CONTINUATION); }
        [[nodiscard]] bool is_shifted() const { return this->test(bucket_flag::IS_SHIFTED); }

        /** @brief First entry of a run: holds a value and is not a continuation. */
        [[nodiscard]] bool is_run_start() const
        {
            return !this->is_empty() && !this->is_continuation();
        }

        /** @brief First entry of a cluster: a run start sitting in its canonical bucket. */
        [[nodiscard]] bool is_cluster_start() const
        {
            return this->is_run_start() && !this->is_shifted();
        }

        /**
         * @brief Returns a copy with exactly one flag replaced.
         * @details Every other bit of the metadata byte, and the stored value, are preserved.
         */
        [[nodiscard]] bucket with_flag(bucket_flag flag, bool value) const
        {
            bucket copy = *this;
            const auto mask = static_cast<uint8_t>(flag);

            if(value)
                copy._metadata |= mask;
            else
                copy._metadata &= static_cast<uint8_t>(~mask);

            return copy;
        }

        /** @brief Returns a copy holding `remainder`, metadata untouched. */
        [[nodiscard]] bucket with_value(uint64_t remainder) const
        {
            bucket copy = *this;
            copy._value = remainder;
            return copy;
        }

        /** @brief An empty bucket that keeps only the slot-bound occupied bit of this one. */
        [[nodiscard]] bucket vacated() const
        {
            return bucket{}.with_flag(bucket_flag::IS_OCCUPIED, this->is_occupied());
        }

        bool operator==(const bucket&) const = default;
    };

    inline bucket empty_bucket()
    {
        return bucket{};
    }

    inline bucket set_flag(const bucket& b, bucket_flag flag, bool value)
    {
        return b.with_flag(flag, value);
    }

    inline std::ostream& operator<<(std::ostream& os, const bucket& b)
    {
        os << "{" << (b.is_occupied() ? 1 : 0) << (b.is_continuation() ? 1 : 0) << (b.is_shifted() ? 1 : 0) << ", ";
        if(b.is_empty())
            os << "empty";
        else
            os << b.remainder();
        os << "}";
        return os;
    }

} // namespace probset::filter
