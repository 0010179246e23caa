//
//  ResultSink.hpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#ifndef ResultSink_hpp
#define ResultSink_hpp

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "LookupResult.hpp"

//
// Collects results in the order they are recorded. Each line is
// written to the live stream and, when an output file is open,
// appended to it and flushed before Record returns, so an interrupted
// run leaves every recorded result on disk exactly once.
//
class ResultSink
{
public:
    ResultSink(std::ostream& Live = std::cout) : m_Live(Live) {}
    ~ResultSink(void) { Close(); }
    const bool Open(const std::filesystem::path& Path);
    void Close(void);
    // Closes the file and forgets every recorded result
    void Reset(void);
    const bool IsFileOpen(void) const { return m_OutputFileStream.is_open(); }
    void SetHexlify(const bool Hexlify) { m_Hexlify = Hexlify; }
    const bool GetHexlify(void) const { return m_Hexlify; }
    // Returns false if the hash has already been recorded
    const bool Record(const LookupResult& Result);
    const std::vector<LookupResult>& GetResults(void) const { return m_Results; }
    std::optional<LookupResult> Find(const std::string& Hash) const;
    const size_t GetTotal(void) const { return m_Results.size(); }
    const size_t GetFound(void) const { return m_Found; }
    const size_t GetNotFound(void) const { return m_NotFound; }
    const size_t GetFailed(void) const { return m_Failed; }
private:
    std::ostream& m_Live;
    std::filesystem::path m_OutFile;
    std::ofstream m_OutputFileStream;
    bool m_Hexlify = false;
    std::vector<LookupResult> m_Results;
    std::unordered_map<std::string, size_t> m_Index;
    size_t m_Found = 0;
    size_t m_NotFound = 0;
    size_t m_Failed = 0;
};

#endif /* ResultSink_hpp */
