//
//  PasswordAudit.hpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#ifndef PasswordAudit_hpp
#define PasswordAudit_hpp

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "HashType.hpp"
#include "LookupResult.hpp"

// Lowercase hex digest of Password for the given type. NT hashes the
// UTF-16LE form of the (UTF-8) password, LM the upper-cased first 14
// characters. Returns std::nullopt for HashTypeUndefined or a password
// that is not valid UTF-8 (NT only).
const std::optional<std::string>
HashPassword(
    const HashType Type,
    const std::string_view Password
);

// Marks every record whose hash equals the hash of Password as found,
// all others as not found. Performs no network access.
const std::vector<LookupResult>
AuditPassword(
    std::span<const HashRecord> Records,
    const HashType Type,
    const std::string& Password
);

#endif /* PasswordAudit_hpp */
