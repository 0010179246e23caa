//
//  HashType.cpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#include <string>
#include <string_view>

#include "HashType.hpp"
#include "Util.hpp"

const HashType
ParseHashType(
    const std::string_view Name
)
{
    const std::string lower = Util::ToLower(Name);

    if (lower == "nt" || lower == "ntlm")
    {
        return HashTypeNT;
    }
    else if (lower == "lm")
    {
        return HashTypeLM;
    }
    else if (lower == "md5")
    {
        return HashTypeMD5;
    }
    else if (lower == "sha1")
    {
        return HashTypeSHA1;
    }
    else if (lower == "sha256")
    {
        return HashTypeSHA256;
    }

    return HashTypeUndefined;
}

const char*
HashTypeToString(
    const HashType Type
)
{
    switch (Type)
    {
        case HashTypeNT:
            return "nt";
        case HashTypeLM:
            return "lm";
        case HashTypeMD5:
            return "md5";
        case HashTypeSHA1:
            return "sha1";
        case HashTypeSHA256:
            return "sha256";
        default:
            return "undefined";
    }
}

const size_t
GetHexLength(
    const HashType Type
)
{
    switch (Type)
    {
        case HashTypeNT:
        case HashTypeLM:
        case HashTypeMD5:
            return 32;
        case HashTypeSHA1:
            return 40;
        case HashTypeSHA256:
            return 64;
        default:
            return 0;
    }
}

const bool
IsHashOfType(
    const std::string_view Hash,
    const HashType Type
)
{
    const size_t length = GetHexLength(Type);
    return length != 0 && Hash.size() == length && Util::IsHex(Hash);
}
