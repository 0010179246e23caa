//
//  PasswordAudit.cpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <vector>

#include <openssl/des.h>
#include <openssl/md4.h>
#include <openssl/md5.h>
#include <openssl/sha.h>

#include "PasswordAudit.hpp"
#include "Util.hpp"

#define LM_PASSWORD_LENGTH 14
#define LM_MAGIC "KGS!@#$%"
#define LM_EMPTY_HASH "aad3b435b51404eeaad3b435b51404ee"

// UTF-8 to UTF-16LE, surrogate pairs for code points above the BMP
static const std::optional<std::vector<uint8_t>>
ToUtf16LE(
    const std::string_view Utf8
)
{
    std::vector<uint8_t> result;
    size_t i = 0;

    auto push = [&](const uint16_t Unit) {
        result.push_back(Unit & 0xff);
        result.push_back(Unit >> 8);
    };

    while (i < Utf8.size())
    {
        const uint8_t c = Utf8[i];
        uint32_t codepoint;
        size_t length;

        if (c < 0x80)
        {
            codepoint = c;
            length = 1;
        }
        else if ((c >> 5) == 0x06)
        {
            codepoint = c & 0x1f;
            length = 2;
        }
        else if ((c >> 4) == 0x0e)
        {
            codepoint = c & 0x0f;
            length = 3;
        }
        else if ((c >> 3) == 0x1e)
        {
            codepoint = c & 0x07;
            length = 4;
        }
        else
        {
            return std::nullopt;
        }

        if (i + length > Utf8.size())
        {
            return std::nullopt;
        }

        for (size_t k = 1; k < length; k++)
        {
            const uint8_t continuation = Utf8[i + k];
            if ((continuation & 0xc0) != 0x80)
            {
                return std::nullopt;
            }
            codepoint = (codepoint << 6) | (continuation & 0x3f);
        }

        if (codepoint >= 0x10000)
        {
            codepoint -= 0x10000;
            push(0xd800 + (codepoint >> 10));
            push(0xdc00 + (codepoint & 0x3ff));
        }
        else
        {
            push(codepoint);
        }

        i += length;
    }

    return result;
}

// Spreads 56 key bits over 8 bytes and sets the DES parity bits
static void
MakeDesKey(
    const uint8_t* Raw,
    DES_cblock* Key
)
{
    (*Key)[0] = Raw[0];
    (*Key)[1] = (Raw[0] << 7) | (Raw[1] >> 1);
    (*Key)[2] = (Raw[1] << 6) | (Raw[2] >> 2);
    (*Key)[3] = (Raw[2] << 5) | (Raw[3] >> 3);
    (*Key)[4] = (Raw[3] << 4) | (Raw[4] >> 4);
    (*Key)[5] = (Raw[4] << 3) | (Raw[5] >> 5);
    (*Key)[6] = (Raw[5] << 2) | (Raw[6] >> 6);
    (*Key)[7] = (Raw[6] << 1);
    DES_set_odd_parity(Key);
}

static const std::string
LmHash(
    const std::string_view Password
)
{
    // Windows stores no LM hash for longer passwords
    if (Password.size() > LM_PASSWORD_LENGTH)
    {
        return LM_EMPTY_HASH;
    }

    std::array<uint8_t, LM_PASSWORD_LENGTH> upper{};

    for (size_t i = 0; i < Password.size(); i++)
    {
        const uint8_t c = Password[i];
        upper[i] = (c >= 'a' && c <= 'z') ? c - ('a' - 'A') : c;
    }

    std::array<uint8_t, 16> digest;
    DES_cblock magic;
    std::memcpy(magic, LM_MAGIC, sizeof(magic));

    for (size_t half = 0; half < 2; half++)
    {
        DES_cblock key;
        DES_key_schedule schedule;
        DES_cblock output;

        MakeDesKey(&upper[half * 7], &key);
        DES_set_key_unchecked(&key, &schedule);
        DES_ecb_encrypt(&magic, &output, &schedule, DES_ENCRYPT);
        std::copy_n(output, sizeof(output), &digest[half * 8]);
    }

    return Util::ToHex(digest.data(), digest.size());
}

const std::optional<std::string>
HashPassword(
    const HashType Type,
    const std::string_view Password
)
{
    auto data = reinterpret_cast<const unsigned char*>(Password.data());

    switch (Type)
    {
        case HashTypeNT:
        {
            auto utf16 = ToUtf16LE(Password);
            if (!utf16.has_value())
            {
                return std::nullopt;
            }
            uint8_t digest[MD4_DIGEST_LENGTH];
            MD4(utf16->data(), utf16->size(), digest);
            return Util::ToHex(digest, sizeof(digest));
        }
        case HashTypeLM:
            return LmHash(Password);
        case HashTypeMD5:
        {
            uint8_t digest[MD5_DIGEST_LENGTH];
            MD5(data, Password.size(), digest);
            return Util::ToHex(digest, sizeof(digest));
        }
        case HashTypeSHA1:
        {
            uint8_t digest[SHA_DIGEST_LENGTH];
            SHA1(data, Password.size(), digest);
            return Util::ToHex(digest, sizeof(digest));
        }
        case HashTypeSHA256:
        {
            uint8_t digest[SHA256_DIGEST_LENGTH];
            SHA256(data, Password.size(), digest);
            return Util::ToHex(digest, sizeof(digest));
        }
        default:
            return std::nullopt;
    }
}

const std::vector<LookupResult>
AuditPassword(
    std::span<const HashRecord> Records,
    const HashType Type,
    const std::string& Password
)
{
    std::vector<LookupResult> results;
    results.reserve(Records.size());

    auto target = HashPassword(Type, Password);
    if (!target.has_value())
    {
        std::cerr << "Error: unable to compute " << HashTypeToString(Type) << " hash of the supplied password" << std::endl;
        for (auto& record : Records)
        {
            results.push_back(LookupResult::Failed(record.Hash));
        }
        return results;
    }

    std::cerr << "Generated " << HashTypeToString(Type) << " hash for the supplied password: " << *target << std::endl;

    for (auto& record : Records)
    {
        if (record.Hash == *target)
        {
            results.push_back(LookupResult::Found(record.Hash, Password));
        }
        else
        {
            results.push_back(LookupResult::NotFound(record.Hash));
        }
    }

    return results;
}
