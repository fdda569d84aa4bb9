#include <cstring>

#include "hash.h"

namespace probset::hash
{
    namespace
    {
        inline uint32_t rotl32(uint32_t x, int8_t r)
        {
            return (x << r) | (x >> (32 - r));
        }

        inline uint32_t fmix32(uint32_t h)
        {
            h ^= h >> 16;
            h *= 0x85ebca6b;
            h ^= h >> 13;
            h *= 0xc2b2ae35;
            h ^= h >> 16;
            return h;
        }

        constexpr uint32_t FNV_OFFSET_BASIS_32 = 0x811c9dc5;
        constexpr uint32_t FNV_PRIME_32 = 0x01000193;
        constexpr uint64_t FNV_OFFSET_BASIS_64 = 0xcbf29ce484222325ULL;
        constexpr uint64_t FNV_PRIME_64 = 0x100000001b3ULL;
    } // namespace

    uint32_t murmur3_x86_32(std::span<const uint8_t> key, uint32_t seed)
    {
        constexpr uint32_t c1 = 0xcc9e2d51;
        constexpr uint32_t c2 = 0x1b873593;

        const size_t len = key.size();
        const size_t nblocks = len / 4;
        const uint8_t* data = key.data();

        uint32_t h1 = seed;

        // body, little endian blocks
        for(size_t i = 0; i < nblocks; ++i)
        {
            uint32_t k1;
            std::memcpy(&k1, data + i * 4, sizeof(k1));

            k1 *= c1;
            k1 = rotl32(k1, 15);
            k1 *= c2;

            h1 ^= k1;
            h1 = rotl32(h1, 13);
            h1 = h1 * 5 + 0xe6546b64;
        }

        // tail
        const uint8_t* tail = data + nblocks * 4;
        uint32_t k1 = 0;

        switch(len & 3)
        {
        case 3:
            k1 ^= static_cast<uint32_t>(tail[2]) << 16;
            [[fallthrough]];
        case 2:
            k1 ^= static_cast<uint32_t>(tail[1]) << 8;
            [[fallthrough]];
        case 1:
            k1 ^= tail[0];
            k1 *= c1;
            k1 = rotl32(k1, 15);
            k1 *= c2;
            h1 ^= k1;
        };

        h1 ^= static_cast<uint32_t>(len);

        return fmix32(h1);
    }

    uint32_t fnv1a_32(std::span<const uint8_t> key)
    {
        uint32_t h = FNV_OFFSET_BASIS_32;
        for(uint8_t byte : key)
        {
            h ^= byte;
            h *= FNV_PRIME_32;
        }
        return h;
    }

    uint64_t fnv1a_64(std::span<const uint8_t> key)
    {
        uint64_t h = FNV_OFFSET_BASIS_64;
        for(uint8_t byte : key)
        {
            h ^= byte;
            h *= FNV_PRIME_64;
        }
        return h;
    }

    hash_function murmur3()
    {
        return {"murmur3_x86_32", 32, [](std::span<const uint8_t> key) -> uint64_t
                { return murmur3_x86_32(key); }};
    }

    hash_function fnv1a32()
    {
        return {"fnv1a_32", 32, [](std::span<const uint8_t> key) -> uint64_t
                { return fnv1a_32(key); }};
    }

    hash_function fnv1a64()
    {
        return {"fnv1a_64", 64, [](std::span<const uint8_t> key) -> uint64_t
                { return fnv1a_64(key); }};
    }

} // namespace probset::hash
