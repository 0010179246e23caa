//
//  HashType.hpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#ifndef HashType_hpp
#define HashType_hpp

#include <cstddef>
#include <string>
#include <string_view>

typedef enum
{
    HashTypeUndefined,
    HashTypeNT,
    HashTypeLM,
    HashTypeMD5,
    HashTypeSHA1,
    HashTypeSHA256
} HashType;

const HashType
ParseHashType(
    const std::string_view Name
);

const char*
HashTypeToString(
    const HashType Type
);

// Number of hex characters in a digest of this type
const size_t
GetHexLength(
    const HashType Type
);

// True if Hash is exactly the right length and all hex
const bool
IsHashOfType(
    const std::string_view Hash,
    const HashType Type
);

#endif /* HashType_hpp */
