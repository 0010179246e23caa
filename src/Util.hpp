//
//  Util.hpp
//  HashLookup
//
//  Created by Kryc on 11/08/2024.
//  Copyright © 2024 Kryc. All rights reserved.
//

#ifndef Util_hpp
#define Util_hpp

#include <vector>
#include <span>
#include <string>
#include <string_view>
#include <cstdint>

namespace Util
{

std::string
ToHex(
    const uint8_t* Bytes,
    const size_t Length
);

std::string
ToHex(
    std::span<const uint8_t> Bytes
);

bool
IsHex(
    const std::string_view String
);

std::string
ToLower(
    const std::string_view String
);

std::string_view
Trim(
    const std::string_view String
);

const std::string
Hexlify(
    const std::string_view Value
);

const std::vector<std::string>
ParseArgv(
    const char* Argv[],
    const int Argc
);

}

#endif /* Util_hpp */
