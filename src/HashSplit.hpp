//
//  HashSplit.hpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#ifndef HashSplit_hpp
#define HashSplit_hpp

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#define DEFAULT_SPLIT_LINES 500
#define SPLIT_FILE_PREFIX "raw-hash-"

// Name of the Index'th (zero based) part, e.g. raw-hash-01
const std::string
SplitFilename(
    const size_t Index
);

// Splits Input into parts of at most LinesPerFile lines inside
// OutputDirectory, creating it if needed. Returns the written paths.
const std::optional<std::vector<std::filesystem::path>>
SplitFile(
    const std::filesystem::path& Input,
    const std::filesystem::path& OutputDirectory,
    const size_t LinesPerFile = DEFAULT_SPLIT_LINES
);

#endif /* HashSplit_hpp */
