//
//  Chunker.cpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#include <algorithm>
#include <stdexcept>

#include "Check.hpp"
#include "Chunker.hpp"

const std::vector<Chunk>
MakeChunks(
    std::span<const HashRecord> Records,
    const size_t ChunkSize
)
{
    if (ChunkSize == 0)
    {
        throw std::invalid_argument("Chunk size must be greater than zero");
    }

    std::vector<Chunk> chunks;
    chunks.reserve((Records.size() + ChunkSize - 1) / ChunkSize);

    for (size_t offset = 0; offset < Records.size(); offset += ChunkSize)
    {
        auto slice = Records.subspan(offset, std::min(ChunkSize, Records.size() - offset));
        chunks.push_back({ chunks.size(), { slice.begin(), slice.end() } });
    }

    DCHECK_EQ(chunks.size(), (Records.size() + ChunkSize - 1) / ChunkSize);

    return chunks;
}
