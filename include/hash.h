#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace probset::hash
{
    using hash_fn_t = uint64_t (*)(std::span<const uint8_t> key);

    /**
     * @brief A named hash capability: maps arbitrary bytes to a fixed-width unsigned integer.
     * @details `bits` is the width of the values produced by `fn`; the filters use it to
     * reject fingerprint widths the hash cannot fill.
     */
    struct hash_function
    {
        std::string name;
        uint32_t bits{};
        hash_fn_t fn{nullptr};

        uint64_t operator()(std::span<const uint8_t> key) const
        {
            return this->fn(key);
        }

        [[nodiscard]] bool valid() const
        {
            return this->fn != nullptr && this->bits > 0 && this->bits <= 64;
        }
    };

    inline std::span<const uint8_t> as_bytes(std::string_view s)
    {
        return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
    }

    // MurmurHash3, x86 32-bit variant (Austin Appleby)
    uint32_t murmur3_x86_32(std::span<const uint8_t> key, uint32_t seed = 0);

    // FNV-1a, 32 and 64 bit
    uint32_t fnv1a_32(std::span<const uint8_t> key);
    uint64_t fnv1a_64(std::span<const uint8_t> key);

    hash_function murmur3();
    hash_function fnv1a32();
    hash_function fnv1a64();

} // namespace probset::hash
