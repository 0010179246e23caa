//
//  ResultSink.cpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#include <iostream>

#include "ResultSink.hpp"

const bool
ResultSink::Open(
    const std::filesystem::path& Path
)
{
    Close();

    m_OutputFileStream.open(Path, std::ios::out | std::ios::app);
    if (!m_OutputFileStream.is_open())
    {
        std::cerr << "Warning: unable to open output file " << Path << ", results will only be shown on the terminal" << std::endl;
        return false;
    }

    m_OutFile = Path;
    return true;
}

void
ResultSink::Close(
    void
)
{
    if (m_OutputFileStream.is_open())
    {
        m_OutputFileStream.close();
    }
}

void
ResultSink::Reset(
    void
)
{
    Close();
    m_Results.clear();
    m_Index.clear();
    m_Found = 0;
    m_NotFound = 0;
    m_Failed = 0;
}

const bool
ResultSink::Record(
    const LookupResult& Result
)
{
    if (m_Index.contains(Result.Hash))
    {
        std::cerr << "Warning: duplicate result for " << Result.Hash << " ignored" << std::endl;
        return false;
    }

    m_Index.emplace(Result.Hash, m_Results.size());
    m_Results.push_back(Result);

    switch (Result.Status)
    {
        case LookupResultFound:
            m_Found++;
            break;
        case LookupResultFailed:
            m_Failed++;
            break;
        default:
            m_NotFound++;
            break;
    }

    const std::string line = Result.ToString(m_Hexlify);

    m_Live << line << std::endl;

    if (m_OutputFileStream.is_open())
    {
        m_OutputFileStream << line << std::endl;
        if (!m_OutputFileStream)
        {
            std::cerr << "Warning: writing to " << m_OutFile << " failed, continuing on the terminal only" << std::endl;
            m_OutputFileStream.close();
        }
    }

    return true;
}

std::optional<LookupResult>
ResultSink::Find(
    const std::string& Hash
) const
{
    auto it = m_Index.find(Hash);
    if (it == m_Index.end())
    {
        return std::nullopt;
    }
    return m_Results[it->second];
}
