#include <algorithm>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>
#include <uuid.h>

#include "filter/quotient_filter.h"
#include "quotient_filter_test_utils.h"

namespace probset::filter
{
    namespace
    {
        quotient_filter make_filter(uint32_t n, uint32_t q)
        {
            auto maybe_qf = quotient_filter::make(n, q);
            if(!maybe_qf)
                throw std::runtime_error("could not build filter: " + maybe_qf.error().to_string());

            return std::move(maybe_qf.value());
        }

        // 1: [3] 2: [4, 16, 16, 31] 3: [1], the run of 3 is pushed to slot 6
        quotient_filter make_colliding_filter()
        {
            auto qf = make_filter(8, 3);

            for(uint64_t fp : {0b010'10000, 0b010'00100, 0b011'00001, 0b010'11111, 0b010'10000, 0b001'00011})
            {
                if(!qf.insert_fingerprint(fp))
                    throw std::runtime_error("insert failed");
            }

            return qf;
        }

        void erase_one(std::vector<uint64_t>& fingerprints, uint64_t fp)
        {
            auto it = std::find(fingerprints.begin(), fingerprints.end(), fp);
            if(it != fingerprints.end())
                fingerprints.erase(it);
        }
    } // namespace

    TEST(QuotientFilterRemoveTest, RemoveThenAbsent)
    {
        auto qf = make_filter(32, 3);

        ASSERT_TRUE(qf.insert("Copenhagen"));
        ASSERT_TRUE(qf.remove("Copenhagen"));

        ASSERT_FALSE(qf.may_contain("Copenhagen"));
        ASSERT_TRUE(qf.empty());
        ASSERT_TRUE(QuotientFilterTest::decode(qf).empty());
        ASSERT_EQ(QuotientFilterTest::store(qf).count_entries(), 0);

        // the slot can be reused
        ASSERT_TRUE(qf.insert("Copenhagen"));
        ASSERT_TRUE(qf.may_contain("Copenhagen"));
    }

    TEST(QuotientFilterRemoveTest, KeyNotFound)
    {
        auto qf = make_filter(32, 3);

        auto status = qf.remove("Copenhagen");
        ASSERT_FALSE(status);
        ASSERT_EQ(status.error().code(), errc::KEY_NOT_FOUND);

        ASSERT_TRUE(qf.insert("Copenhagen"));

        // unoccupied canonical bucket
        status = qf.remove("Rome");
        ASSERT_FALSE(status);
        ASSERT_EQ(status.error().code(), errc::KEY_NOT_FOUND);

        // same quotient, different remainder
        const uint64_t fp = qf.fingerprint_of(hash::as_bytes("Copenhagen"));
        status = qf.remove_fingerprint(fp ^ 1);
        ASSERT_FALSE(status);
        ASSERT_EQ(status.error().code(), errc::KEY_NOT_FOUND);

        ASSERT_EQ(qf.size(), 1);
        ASSERT_TRUE(qf.may_contain("Copenhagen"));
    }

    TEST(QuotientFilterRemoveTest, RemovesOneCopyOfDuplicates)
    {
        auto qf = make_filter(16, 4);

        ASSERT_TRUE(qf.insert("Berlin"));
        ASSERT_TRUE(qf.insert("Berlin"));

        ASSERT_TRUE(qf.remove("Berlin"));
        ASSERT_TRUE(qf.may_contain("Berlin"));
        ASSERT_EQ(qf.size(), 1);

        ASSERT_TRUE(qf.remove("Berlin"));
        ASSERT_FALSE(qf.may_contain("Berlin"));

        auto status = qf.remove("Berlin");
        ASSERT_FALSE(status);
        ASSERT_EQ(status.error().code(), errc::KEY_NOT_FOUND);
    }

    TEST(QuotientFilterRemoveTest, RemoveRunHead)
    {
        auto qf = make_colliding_filter();

        ASSERT_TRUE(qf.remove_fingerprint(0b010'00100));

        const auto& store = QuotientFilterTest::store(qf);

        // the second entry becomes the head, in its canonical slot
        ASSERT_EQ(store.at(2), (bucket{0b10000, bucket::flags(1, 0, 0)}));
        ASSERT_EQ(qf.find_run(2), (run_bounds{2, 5}));
        ASSERT_EQ(qf.find_run(3), (run_bounds{5, 6}));
        ASSERT_TRUE(store.at(6).is_empty());

        std::vector<uint64_t> expected = {0b001'00011, 0b010'10000, 0b010'10000, 0b010'11111, 0b011'00001};
        ASSERT_EQ(QuotientFilterTest::decode(qf), expected);
        ASSERT_FALSE(qf.contains_fingerprint(0b010'00100));
    }

    TEST(QuotientFilterRemoveTest, RemovingARunPullsTheClusterBack)
    {
        auto qf = make_colliding_filter();

        for(uint64_t fp : {0b010'00100, 0b010'10000, 0b010'11111, 0b010'10000})
            ASSERT_TRUE(qf.remove_fingerprint(fp)) << fp;

        const auto& store = QuotientFilterTest::store(qf);

        ASSERT_FALSE(store.at(2).is_occupied());
        ASSERT_TRUE(store.at(2).is_empty());

        // the run of 3 is back in its canonical slot
        ASSERT_EQ(store.at(3), (bucket{0b00001, bucket::flags(1, 0, 0)}));
        ASSERT_EQ(qf.find_run(3), (run_bounds{3, 4}));
        ASSERT_TRUE(qf.find_run(2).empty());

        std::vector<uint64_t> expected = {0b001'00011, 0b011'00001};
        ASSERT_EQ(QuotientFilterTest::decode(qf), expected);
        ASSERT_EQ(qf.size(), 2);
    }

    TEST(QuotientFilterRemoveTest, RemoveInsideAWrappingCluster)
    {
        auto qf = make_filter(8, 3);

        std::vector<uint64_t> fingerprints = {
            0b111'00010, 0b111'00001, 0b110'00111, 0b111'00011, 0b110'00001, 0b111'11111};

        for(uint64_t fp : fingerprints)
            ASSERT_TRUE(qf.insert_fingerprint(fp)) << fp;

        // head of the run of 6, the rest of the cluster slides back across the end of the array
        ASSERT_TRUE(qf.remove_fingerprint(0b110'00001));
        erase_one(fingerprints, 0b110'00001);

        const auto& store = QuotientFilterTest::store(qf);
        ASSERT_EQ(store.at(6), (bucket{0b00111, bucket::flags(1, 0, 0)}));
        ASSERT_EQ(store.at(7), (bucket{0b00001, bucket::flags(1, 0, 0)}));
        ASSERT_EQ(qf.find_run(7), (run_bounds{7, 3}));
        ASSERT_TRUE(store.at(3).is_empty());

        std::sort(fingerprints.begin(), fingerprints.end());
        ASSERT_EQ(QuotientFilterTest::decode(qf), fingerprints);

        for(uint64_t fp : fingerprints)
            ASSERT_TRUE(qf.contains_fingerprint(fp)) << fp;
    }

    TEST(QuotientFilterRemoveTest, FullFilterAcceptsInsertsAfterRemove)
    {
        auto qf = make_filter(8, 2);

        ASSERT_TRUE(qf.insert_fingerprint(0b11'000001));
        ASSERT_TRUE(qf.insert_fingerprint(0b11'000010));
        ASSERT_TRUE(qf.insert_fingerprint(0b00'000011));
        ASSERT_FALSE(qf.insert_fingerprint(0b01'000001));

        ASSERT_TRUE(qf.remove_fingerprint(0b11'000001));
        ASSERT_TRUE(qf.insert_fingerprint(0b01'000001));

        std::vector<uint64_t> expected = {0b00'000011, 0b01'000001, 0b11'000010};
        ASSERT_EQ(QuotientFilterTest::decode(qf), expected);
    }

    TEST(QuotientFilterRemoveTest, RandomInsertRemoveInterleaving)
    {
        // n = 12, q = 6: 64 buckets, remainders of 6 bits
        auto qf = make_filter(12, 6);

        std::mt19937_64 rng(1337);

        // quotients around the end of the array, so clusters are long and wrap
        std::uniform_int_distribution<uint64_t> quotient_dist(0, 15);
        std::uniform_int_distribution<uint64_t> remainder_dist(0, 63);
        std::uniform_int_distribution<int> op_dist(0, 99);

        std::vector<uint64_t> model;

        for(int i = 0; i < 5000; ++i)
        {
            const bool do_insert = model.empty() || (model.size() < qf.capacity() && op_dist(rng) < 55);

            if(do_insert)
            {
                const uint64_t f_q = (quotient_dist(rng) + 56) % 64;
                const uint64_t fp = (f_q << 6) | remainder_dist(rng);

                ASSERT_TRUE(qf.insert_fingerprint(fp)) << "insert " << fp << " at step " << i;
                model.push_back(fp);
            }
            else
            {
                std::uniform_int_distribution<size_t> pick(0, model.size() - 1);
                const uint64_t fp = model[pick(rng)];

                ASSERT_TRUE(qf.remove_fingerprint(fp)) << "remove " << fp << " at step " << i;
                erase_one(model, fp);

                const bool still_stored = std::find(model.begin(), model.end(), fp) != model.end();
                ASSERT_EQ(qf.contains_fingerprint(fp), still_stored) << fp;
            }

            ASSERT_EQ(qf.size(), model.size());

            if(i % 25 == 0)
            {
                auto expected = model;
                std::sort(expected.begin(), expected.end());
                ASSERT_EQ(QuotientFilterTest::decode(qf), expected) << "step " << i;

                for(uint64_t fp : model)
                    ASSERT_TRUE(qf.contains_fingerprint(fp)) << "lost " << fp << " at step " << i;
            }
        }

        // drain
        while(!model.empty())
        {
            ASSERT_TRUE(qf.remove_fingerprint(model.back()));
            model.pop_back();
        }

        ASSERT_TRUE(qf.empty());
        ASSERT_EQ(QuotientFilterTest::store(qf).count_entries(), 0);
        ASSERT_TRUE(QuotientFilterTest::decode(qf).empty());
    }

    TEST(QuotientFilterRemoveTest, RemoveUuidKeys)
    {
        auto qf = make_filter(32, 10);

        std::mt19937 generator{98765};
        uuids::uuid_random_generator gen{generator};

        std::vector<uuids::uuid> keys;
        for(size_t i = 0; i < 900; ++i)
        {
            keys.emplace_back(gen());
            ASSERT_TRUE(qf.insert(uuid_bytes(keys.back())));
        }

        // remove every other key
        for(size_t i = 0; i < keys.size(); i += 2)
            ASSERT_TRUE(qf.remove(uuid_bytes(keys[i]))) << uuids::to_string(keys[i]);

        ASSERT_EQ(qf.size(), keys.size() / 2);

        for(size_t i = 1; i < keys.size(); i += 2)
            ASSERT_TRUE(qf.may_contain(uuid_bytes(keys[i]))) << uuids::to_string(keys[i]);

        ASSERT_EQ(QuotientFilterTest::decode(qf).size(), keys.size() / 2);
    }

} // namespace probset::filter
