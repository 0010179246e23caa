//
//  HashExtractor.cpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "HashExtractor.hpp"
#include "Util.hpp"

typedef enum
{
    ScanStateBoundary,
    ScanStateHexRun,
    ScanStateWord
} ScanState;

static inline const bool
IsHexChar(
    const unsigned char Char
)
{
    return (Char >= '0' && Char <= '9') ||
           (Char >= 'a' && Char <= 'f') ||
           (Char >= 'A' && Char <= 'F');
}

static inline const bool
IsWordChar(
    const unsigned char Char
)
{
    return (Char >= '0' && Char <= '9') ||
           (Char >= 'a' && Char <= 'z') ||
           (Char >= 'A' && Char <= 'Z') ||
           Char == '_' ||
           Char >= 0x80;
}

void
HashExtractor::Emit(
    const std::string_view Token
)
{
    std::string hash = Util::ToLower(Token);

    if (!m_Seen.insert(hash).second)
    {
        m_Duplicates++;
        return;
    }

    m_Records.push_back({ std::move(hash), m_Type });

    if (m_Status)
    {
        std::cerr << "\rExtracted " << m_Records.size() << " hashes" << std::flush;
    }
}

void
HashExtractor::Scan(
    const std::string_view Text
)
{
    ScanState state = ScanStateBoundary;
    size_t start = 0;

    if (m_Length == 0)
    {
        return;
    }

    for (size_t i = 0; i < Text.size(); i++)
    {
        const unsigned char c = Text[i];

        switch (state)
        {
            case ScanStateBoundary:
                if (IsHexChar(c))
                {
                    start = i;
                    state = ScanStateHexRun;
                }
                else if (IsWordChar(c))
                {
                    state = ScanStateWord;
                }
                break;
            case ScanStateHexRun:
                if (IsHexChar(c))
                {
                    // Too long to ever be a match
                    if (i - start + 1 > m_Length)
                    {
                        state = ScanStateWord;
                    }
                }
                else if (IsWordChar(c))
                {
                    state = ScanStateWord;
                }
                else
                {
                    if (i - start == m_Length)
                    {
                        Emit(Text.substr(start, m_Length));
                    }
                    state = ScanStateBoundary;
                }
                break;
            case ScanStateWord:
                if (!IsWordChar(c))
                {
                    state = ScanStateBoundary;
                }
                break;
        }
    }

    // Token running to the end of the input
    if (state == ScanStateHexRun && Text.size() - start == m_Length)
    {
        Emit(Text.substr(start, m_Length));
    }
}

const std::optional<std::vector<HashRecord>>
HashExtractor::ExtractFile(
    const std::filesystem::path& Path
)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(Path, ec))
    {
        std::cerr << "Error: input file " << Path << " does not exist" << std::endl;
        return std::nullopt;
    }

    std::ifstream infile(Path, std::ios::in | std::ios::binary);
    if (!infile.is_open())
    {
        std::cerr << "Error: unable to open input file " << Path << std::endl;
        return std::nullopt;
    }

    std::string text(
        (std::istreambuf_iterator<char>(infile)),
        std::istreambuf_iterator<char>()
    );

    if (infile.bad())
    {
        std::cerr << "Error: unable to read input file " << Path << std::endl;
        return std::nullopt;
    }

    Scan(text);

    if (m_Status && !m_Records.empty())
    {
        std::cerr << std::endl;
    }

    return m_Records;
}

const std::vector<HashRecord>
ExtractHashes(
    const std::string_view Text,
    const HashType Type
)
{
    HashExtractor extractor(Type);
    extractor.Scan(Text);
    return extractor.GetRecords();
}

const bool
WriteHashList(
    const std::filesystem::path& Path,
    std::span<const HashRecord> Records
)
{
    std::ofstream outfile(Path, std::ios::out | std::ios::trunc);
    if (!outfile.is_open())
    {
        std::cerr << "Error: unable to open " << Path << " for writing" << std::endl;
        return false;
    }

    for (auto& record : Records)
    {
        outfile << record.Hash << '\n';
    }

    outfile.flush();
    if (!outfile)
    {
        std::cerr << "Error: failed writing hash list to " << Path << std::endl;
        return false;
    }

    return true;
}
