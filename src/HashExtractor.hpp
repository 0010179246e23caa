//
//  HashExtractor.hpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#ifndef HashExtractor_hpp
#define HashExtractor_hpp

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "HashType.hpp"
#include "LookupResult.hpp"

//
// Scans arbitrary text (secretsdump output, pwdump files, logs) for
// standalone hex tokens of the digest length of a single hash type.
// Tokens are delimited by anything that is not a word character
// ([A-Za-z0-9_] or a non-ASCII byte), so "user:1001:<lm>:<nt>:::"
// yields both 32 character fields while "0x<hash>" and longer hex
// runs yield nothing. Results are lowercased and deduplicated, in the
// order they were first seen.
//
class HashExtractor
{
public:
    HashExtractor(const HashType Type) : m_Type(Type), m_Length(GetHexLength(Type)) {}
    void SetStatus(const bool Status) { m_Status = Status; }
    const HashType GetType(void) const { return m_Type; }
    const size_t GetCount(void) const { return m_Records.size(); }
    const size_t GetDuplicates(void) const { return m_Duplicates; }
    const std::vector<HashRecord>& GetRecords(void) const { return m_Records; }
    // Can be called repeatedly, deduplication spans all calls
    void Scan(const std::string_view Text);
    const std::optional<std::vector<HashRecord>> ExtractFile(const std::filesystem::path& Path);
private:
    void Emit(const std::string_view Token);
    HashType m_Type;
    size_t m_Length;
    bool m_Status = false;
    size_t m_Duplicates = 0;
    std::vector<HashRecord> m_Records;
    std::unordered_set<std::string> m_Seen;
};

const std::vector<HashRecord>
ExtractHashes(
    const std::string_view Text,
    const HashType Type
);

const bool
WriteHashList(
    const std::filesystem::path& Path,
    std::span<const HashRecord> Records
);

#endif /* HashExtractor_hpp */
