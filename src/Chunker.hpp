//
//  Chunker.hpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#ifndef Chunker_hpp
#define Chunker_hpp

#include <cstddef>
#include <span>
#include <vector>

#include "LookupResult.hpp"

// The most hashes the service accepts in one request
#define MAX_CHUNK_SIZE 300

struct Chunk
{
    size_t Index;
    std::vector<HashRecord> Records;

    const size_t Size(void) const { return Records.size(); }
};

// Partitions Records into ceil(N / ChunkSize) contiguous chunks.
// Throws std::invalid_argument if ChunkSize is 0.
const std::vector<Chunk>
MakeChunks(
    std::span<const HashRecord> Records,
    const size_t ChunkSize = MAX_CHUNK_SIZE
);

#endif /* Chunker_hpp */
