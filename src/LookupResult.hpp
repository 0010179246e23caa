//
//  LookupResult.hpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#ifndef LookupResult_hpp
#define LookupResult_hpp

#include <optional>
#include <string>

#include "HashType.hpp"
#include "Util.hpp"

#define NOT_FOUND_MARKER "[not found]"
#define LOOKUP_FAILED_MARKER "[lookup failed]"

// A hash extracted from the input. Hash is always lowercase.
struct HashRecord
{
    std::string Hash;
    HashType Type = HashTypeUndefined;

    bool operator==(const HashRecord& Other) const { return Hash == Other.Hash && Type == Other.Type; }
};

typedef enum
{
    LookupResultFound,
    LookupResultNotFound,
    LookupResultFailed
} LookupStatus;

struct LookupResult
{
    std::string Hash;
    std::optional<std::string> Password;
    LookupStatus Status = LookupResultNotFound;

    static LookupResult Found(const std::string& Hash, const std::string& Password) { return { Hash, Password, LookupResultFound }; }
    static LookupResult NotFound(const std::string& Hash) { return { Hash, std::nullopt, LookupResultNotFound }; }
    static LookupResult Failed(const std::string& Hash) { return { Hash, std::nullopt, LookupResultFailed }; }

    const std::string
    ToString(
        const bool Hexlify = false
    ) const
    {
        switch (Status)
        {
            case LookupResultFound:
                return Hash + ":" + (Hexlify ? Util::Hexlify(*Password) : *Password);
            case LookupResultFailed:
                return Hash + ":" LOOKUP_FAILED_MARKER;
            default:
                return Hash + ":" NOT_FOUND_MARKER;
        }
    }
};

#endif /* LookupResult_hpp */
