//
//  HashLookup.cpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "HashExtractor.hpp"
#include "HashLookup.hpp"
#include "PasswordAudit.hpp"

const LookupMode
HashLookup::GetMode(
    void
) const
{
    if (!m_SplitDirectory.empty())
    {
        return ModeSplit;
    }
    else if (!m_Hash.empty())
    {
        return ModeSingle;
    }
    else if (!m_HashFile.empty())
    {
        return m_HasPassword ? ModeAudit : ModeBulk;
    }
    return ModeUnknown;
}

const bool
HashLookup::Initialize(
    void
)
{
    const LookupMode mode = GetMode();

    if (mode == ModeUnknown)
    {
        std::cerr << "Error: no input specified, use --file or --hash" << std::endl;
        return false;
    }

    if (!m_Hash.empty() && !m_HashFile.empty())
    {
        std::cerr << "Error: --file and --hash cannot be used together" << std::endl;
        return false;
    }

    if (mode == ModeSplit)
    {
        if (m_HashFile.empty())
        {
            std::cerr << "Error: --split requires an input --file" << std::endl;
            return false;
        }
        return true;
    }

    if (m_Type == HashTypeUndefined)
    {
        std::cerr << "Error: no hash type specified" << std::endl;
        return false;
    }

    if (m_ChunkSize == 0 || m_ChunkSize > MAX_CHUNK_SIZE)
    {
        std::cerr << "Error: chunk size must be between 1 and " << MAX_CHUNK_SIZE << std::endl;
        return false;
    }

    if (m_Retries > MAX_RETRIES)
    {
        std::cerr << "Error: retries must be between 0 and " << MAX_RETRIES << std::endl;
        return false;
    }

    if (m_Delay.count() < 0)
    {
        std::cerr << "Error: delay must not be negative" << std::endl;
        return false;
    }

    if (m_Timeout.count() <= 0)
    {
        std::cerr << "Error: timeout must be greater than zero" << std::endl;
        return false;
    }

    if (m_Transport == nullptr && (mode == ModeBulk || mode == ModeSingle))
    {
        auto url = ParseServiceUrl(m_Url);
        if (!url.has_value())
        {
            std::cerr << "Error: invalid service URL \"" << m_Url << "\"" << std::endl;
            return false;
        }
        m_Transport = std::make_shared<HttpsTransport>(*url, m_Timeout);
    }

    if (m_Pacer == nullptr)
    {
        m_Pacer = std::make_shared<SleepPacer>(&m_Interrupted);
    }

    m_Sink.SetHexlify(m_Hexlify);

    // Falling back to the terminal is not fatal
    if (!m_OutFile.empty())
    {
        m_Sink.Open(m_OutFile);
    }

    return true;
}

const bool
HashLookup::Extract(
    void
)
{
    HashExtractor extractor(m_Type);
    extractor.SetStatus(m_Status);

    std::cerr << "Extracting " << HashTypeToString(m_Type) << " hashes from " << m_HashFile.string() << std::endl;

    auto records = extractor.ExtractFile(m_HashFile);
    if (!records.has_value())
    {
        return false;
    }

    m_Records = std::move(records.value());
    m_Summary.Extracted = m_Records.size();

    std::cerr << "Extracted " << m_Records.size() << " unique hashes";
    if (extractor.GetDuplicates() > 0)
    {
        std::cerr << " (" << extractor.GetDuplicates() << " duplicates skipped)";
    }
    std::cerr << std::endl;

    if (!m_ExtractedFile.empty())
    {
        if (WriteHashList(m_ExtractedFile, m_Records))
        {
            std::cerr << "Saved extracted hashes to " << m_ExtractedFile.string() << std::endl;
        }
        else
        {
            std::cerr << "Warning: continuing without the extracted hash list" << std::endl;
        }
    }

    return true;
}

void
HashLookup::ChunkCompleted(
    const Chunk& Batch,
    const std::vector<LookupResult>& Results
)
{
    size_t found = 0;
    size_t notfound = 0;
    size_t failed = 0;

    for (auto& result : Results)
    {
        if (!m_Sink.Record(result))
        {
            continue;
        }

        switch (result.Status)
        {
            case LookupResultFound:
                found++;
                break;
            case LookupResultFailed:
                failed++;
                break;
            default:
                notfound++;
                break;
        }
    }

    m_Summary.ChunksCompleted++;

    if (m_Status)
    {
        std::cerr << "Chunk " << Batch.Index + 1 << "/" << m_Summary.ChunksTotal
                  << ": found " << found
                  << ", not found " << notfound
                  << ", failed " << failed << std::endl;
    }
}

const bool
HashLookup::RunSingle(
    void
)
{
    LookupClient client(*m_Transport, *m_Pacer);
    client.SetRetries(m_Retries);
    client.SetRetryDelay(m_Delay);
    client.SetMissingAsFailed(m_MissingAsFailed);

    m_Sink.Record(client.LookupSingle(m_Hash, m_Type));
    m_Summary.Requests = client.GetRequestCount();

    return true;
}

const bool
HashLookup::RunBulk(
    void
)
{
    if (!Extract())
    {
        return false;
    }

    if (m_Records.empty())
    {
        std::cerr << "No " << HashTypeToString(m_Type) << " hashes found in " << m_HashFile.string() << std::endl;
        return true;
    }

    auto chunks = MakeChunks(m_Records, m_ChunkSize);
    m_Summary.ChunksTotal = chunks.size();

    std::cerr << "Looking up " << m_Records.size() << " hashes in " << chunks.size()
              << " requests of up to " << m_ChunkSize << std::endl;

    LookupClient client(*m_Transport, *m_Pacer);
    client.SetRetries(m_Retries);
    client.SetRetryDelay(m_Delay);
    client.SetMissingAsFailed(m_MissingAsFailed);

    PacedQueue<Chunk> queue(*m_Pacer, m_Delay);
    for (auto& chunk : chunks)
    {
        queue.Push(std::move(chunk));
    }

    queue.Drain(
        [&](Chunk& Batch) {
            ChunkCompleted(Batch, client.LookupChunk(Batch, m_Type));
        },
        &m_Interrupted
    );

    m_Summary.Requests = client.GetRequestCount();

    if (m_Interrupted)
    {
        m_Summary.Interrupted = true;
        std::cerr << "Interrupted after " << m_Summary.ChunksCompleted << " of " << m_Summary.ChunksTotal
                  << " chunks, " << m_Records.size() - m_Sink.GetTotal() << " hashes were not looked up" << std::endl;
    }

    return true;
}

const bool
HashLookup::RunAudit(
    void
)
{
    if (!Extract())
    {
        return false;
    }

    for (auto& result : AuditPassword(m_Records, m_Type, m_Password))
    {
        m_Sink.Record(result);
    }

    std::cerr << "Found " << m_Sink.GetFound() << " matches out of " << m_Records.size() << " hashes" << std::endl;

    return true;
}

const bool
HashLookup::RunSplit(
    void
)
{
    auto parts = SplitFile(m_HashFile, m_SplitDirectory, m_SplitLines);
    if (!parts.has_value())
    {
        return false;
    }

    std::cerr << "Split " << m_HashFile.string() << " into " << parts->size() << " files" << std::endl;

    return true;
}

void
HashLookup::PrintSummary(
    void
) const
{
    std::cerr << "Processed " << m_Summary.Processed << " hashes" << std::endl;
    std::cerr << "Found     " << m_Summary.Found << std::endl;
    std::cerr << "Not found " << m_Summary.NotFound << std::endl;
    std::cerr << "Failed    " << m_Summary.Failed << std::endl;
    if (m_Summary.ChunksTotal > 0)
    {
        std::cerr << "Chunks    " << m_Summary.ChunksCompleted << "/" << m_Summary.ChunksTotal << std::endl;
    }
}

const bool
HashLookup::Run(
    void
)
{
    bool result = false;

    m_Summary = RunSummary();
    m_Succeeded = false;
    m_Records.clear();
    m_Sink.Reset();

    if (!Initialize())
    {
        return false;
    }

    switch (GetMode())
    {
        case ModeSplit:
            m_Succeeded = RunSplit();
            return m_Succeeded;
        case ModeSingle:
            result = RunSingle();
            break;
        case ModeAudit:
            result = RunAudit();
            break;
        case ModeBulk:
            result = RunBulk();
            break;
        default:
            break;
    }

    m_Summary.Processed = m_Sink.GetTotal();
    m_Summary.Found = m_Sink.GetFound();
    m_Summary.NotFound = m_Sink.GetNotFound();
    m_Summary.Failed = m_Sink.GetFailed();

    PrintSummary();

    m_Sink.Close();
    m_Succeeded = result;

    return result;
}
