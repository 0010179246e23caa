#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "Chunker.hpp"
#include "Fakes.hpp"

TEST(Chunker, SevenHundred) {
    auto records = MakeRecords(700);
    auto chunks = MakeChunks(records, 300);
    ASSERT_EQ(chunks.size(), 3);
    EXPECT_EQ(chunks[0].Size(), 300);
    EXPECT_EQ(chunks[1].Size(), 300);
    EXPECT_EQ(chunks[2].Size(), 100);
    for (size_t i = 0; i < chunks.size(); i++)
    {
        EXPECT_EQ(chunks[i].Index, i);
    }
}

TEST(Chunker, ConcatenationRestoresInput) {
    auto records = MakeRecords(123);
    for (size_t size : { 1, 7, 122, 123, 124, 300 })
    {
        auto chunks = MakeChunks(records, size);
        EXPECT_EQ(chunks.size(), (records.size() + size - 1) / size);
        std::vector<HashRecord> joined;
        for (auto& chunk : chunks)
        {
            EXPECT_GT(chunk.Size(), 0);
            EXPECT_LE(chunk.Size(), size);
            joined.insert(joined.end(), chunk.Records.begin(), chunk.Records.end());
        }
        EXPECT_EQ(joined, records);
    }
}

TEST(Chunker, ExactMultiple) {
    auto chunks = MakeChunks(MakeRecords(600));
    ASSERT_EQ(chunks.size(), 2);
    EXPECT_EQ(chunks[1].Size(), MAX_CHUNK_SIZE);
}

TEST(Chunker, Empty) {
    EXPECT_TRUE(MakeChunks(std::vector<HashRecord>()).empty());
}

TEST(Chunker, ZeroSizeThrows) {
    auto records = MakeRecords(3);
    EXPECT_THROW(MakeChunks(records, 0), std::invalid_argument);
}
