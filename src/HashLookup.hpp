//
//  HashLookup.hpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#ifndef HashLookup_hpp
#define HashLookup_hpp

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "Chunker.hpp"
#include "HashSplit.hpp"
#include "HashType.hpp"
#include "HttpTransport.hpp"
#include "LookupClient.hpp"
#include "Pacer.hpp"
#include "ResultSink.hpp"

#define DEFAULT_SERVICE_URL "https://ntlm.pw/api/lookup"
#define DEFAULT_TIMEOUT_MS 30000
#define MAX_RETRIES 10

typedef enum
{
    ModeUnknown,
    ModeBulk,
    ModeSingle,
    ModeAudit,
    ModeSplit
} LookupMode;

struct RunSummary
{
    size_t Extracted = 0;
    size_t Processed = 0;
    size_t Found = 0;
    size_t NotFound = 0;
    size_t Failed = 0;
    size_t ChunksCompleted = 0;
    size_t ChunksTotal = 0;
    size_t Requests = 0;
    bool Interrupted = false;
};

class HashLookup
{
public:
    HashLookup(std::ostream& Live = std::cout) : m_Live(Live) {}
    void SetType(const HashType Type) { m_Type = Type; }
    void SetHashFile(const std::filesystem::path HashFile) { m_HashFile = HashFile; }
    void SetHash(const std::string Hash) { m_Hash = Hash; }
    void SetOutFile(const std::filesystem::path OutFile) { m_OutFile = OutFile; }
    void SetExtractedFile(const std::filesystem::path ExtractedFile) { m_ExtractedFile = ExtractedFile; }
    void SetPassword(const std::string Password) { m_Password = Password; m_HasPassword = true; }
    void SetSplitDirectory(const std::filesystem::path SplitDirectory) { m_SplitDirectory = SplitDirectory; }
    void SetSplitLines(const size_t SplitLines) { m_SplitLines = SplitLines; }
    void SetUrl(const std::string Url) { m_Url = Url; }
    void SetChunkSize(const size_t ChunkSize) { m_ChunkSize = ChunkSize; }
    void SetDelay(const std::chrono::milliseconds Delay) { m_Delay = Delay; }
    void SetRetries(const size_t Retries) { m_Retries = Retries; }
    void SetTimeout(const std::chrono::milliseconds Timeout) { m_Timeout = Timeout; }
    void SetMissingAsFailed(const bool MissingAsFailed) { m_MissingAsFailed = MissingAsFailed; }
    void SetHexlify(const bool Hexlify) { m_Hexlify = Hexlify; }
    void SetStatus(const bool Status) { m_Status = Status; }
    void SetTransport(HttpTransportPtr Transport) { m_Transport = Transport; }
    void SetPacer(PacerPtr Pacer) { m_Pacer = Pacer; }
    const HashType GetType(void) const { return m_Type; }
    const std::filesystem::path GetHashFile(void) const { return m_HashFile; }
    const std::string GetHash(void) const { return m_Hash; }
    const std::filesystem::path GetOutFile(void) const { return m_OutFile; }
    const std::filesystem::path GetExtractedFile(void) const { return m_ExtractedFile; }
    const std::filesystem::path GetSplitDirectory(void) const { return m_SplitDirectory; }
    const size_t GetSplitLines(void) const { return m_SplitLines; }
    const std::string GetUrl(void) const { return m_Url; }
    const size_t GetChunkSize(void) const { return m_ChunkSize; }
    const std::chrono::milliseconds GetDelay(void) const { return m_Delay; }
    const size_t GetRetries(void) const { return m_Retries; }
    const std::chrono::milliseconds GetTimeout(void) const { return m_Timeout; }
    const bool GetMissingAsFailed(void) const { return m_MissingAsFailed; }
    const bool GetHexlify(void) const { return m_Hexlify; }
    const LookupMode GetMode(void) const;
    const RunSummary& GetSummary(void) const { return m_Summary; }
    const ResultSink& GetSink(void) const { return m_Sink; }
    std::atomic<bool>& GetInterruptFlag(void) { return m_Interrupted; }
    void Interrupt(void) { m_Interrupted = true; }
    const bool Succeeded(void) const { return m_Succeeded; }
    // Validates the configuration and performs the selected mode
    const bool Run(void);
private:
    const bool Initialize(void);
    const bool RunSingle(void);
    const bool RunBulk(void);
    const bool RunAudit(void);
    const bool RunSplit(void);
    const bool Extract(void);
    void ChunkCompleted(const Chunk& Batch, const std::vector<LookupResult>& Results);
    void PrintSummary(void) const;
    std::ostream& m_Live;
    HashType m_Type = HashTypeUndefined;
    std::filesystem::path m_HashFile;
    std::string m_Hash;
    std::filesystem::path m_OutFile;
    std::filesystem::path m_ExtractedFile;
    std::string m_Password;
    bool m_HasPassword = false;
    std::filesystem::path m_SplitDirectory;
    size_t m_SplitLines = DEFAULT_SPLIT_LINES;
    std::string m_Url = DEFAULT_SERVICE_URL;
    size_t m_ChunkSize = MAX_CHUNK_SIZE;
    std::chrono::milliseconds m_Delay = std::chrono::milliseconds(DEFAULT_PACING_MS);
    size_t m_Retries = DEFAULT_RETRIES;
    std::chrono::milliseconds m_Timeout = std::chrono::milliseconds(DEFAULT_TIMEOUT_MS);
    bool m_MissingAsFailed = false;
    bool m_Hexlify = false;
    bool m_Status = true;
    HttpTransportPtr m_Transport;
    PacerPtr m_Pacer;
    ResultSink m_Sink{m_Live};
    std::vector<HashRecord> m_Records;
    RunSummary m_Summary;
    std::atomic<bool> m_Interrupted = false;
    bool m_Succeeded = false;
};

#endif /* HashLookup_hpp */
