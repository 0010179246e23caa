//
//  LookupClient.cpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#include <iostream>
#include <string>

#include "Check.hpp"
#include "LookupClient.hpp"
#include "Util.hpp"

const ResponseMap
ParseLookupResponse(
    const std::string_view Body
)
{
    ResponseMap results;
    size_t offset = 0;

    while (offset < Body.size())
    {
        size_t end = Body.find('\n', offset);
        if (end == std::string_view::npos)
        {
            end = Body.size();
        }

        std::string_view line = Body.substr(offset, end - offset);
        offset = end + 1;

        if (!line.empty() && line.back() == '\r')
        {
            line.remove_suffix(1);
        }

        // Passwords can contain colons, the hash never does
        const size_t colon = line.find(':');
        if (colon == std::string_view::npos)
        {
            continue;
        }

        std::string hash = Util::ToLower(Util::Trim(line.substr(0, colon)));
        if (hash.empty())
        {
            continue;
        }

        const std::string_view value = line.substr(colon + 1);
        if (value == NOT_FOUND_MARKER)
        {
            results.emplace(std::move(hash), std::nullopt);
        }
        else
        {
            results.emplace(std::move(hash), std::string(value));
        }
    }

    return results;
}

std::optional<HttpResponse>
LookupClient::SendWithRetry(
    const std::string& Description,
    const std::function<std::optional<HttpResponse>(void)>& Send
)
{
    for (size_t attempt = 0; attempt <= m_Retries; attempt++)
    {
        if (attempt > 0)
        {
            std::cerr << "Retrying " << Description << " (attempt " << attempt + 1 << " of " << m_Retries + 1 << ")" << std::endl;
            if (!m_Pacer.Pause(m_RetryDelay))
            {
                std::cerr << "Warning: interrupted, abandoning " << Description << std::endl;
                return std::nullopt;
            }
        }

        m_Requests++;
        auto response = Send();

        if (!response.has_value())
        {
            continue;
        }

        if (response->Status == HTTP_STATUS_OK || response->Status == HTTP_STATUS_NO_CONTENT)
        {
            return response;
        }

        std::cerr << "Error: unexpected status code " << response->Status << " for " << Description << std::endl;
    }

    return std::nullopt;
}

const std::vector<LookupResult>
LookupClient::LookupChunk(
    const Chunk& Batch,
    const HashType Type
)
{
    std::vector<LookupResult> results;
    std::string body;

    if (Batch.Records.empty())
    {
        return results;
    }

    results.reserve(Batch.Size());

    for (auto& record : Batch.Records)
    {
        if (!body.empty())
        {
            body.push_back('\n');
        }
        body += record.Hash;
    }

    const std::string target = std::string("?hashtype=") + HashTypeToString(Type);
    auto response = SendWithRetry(
        "chunk " + std::to_string(Batch.Index + 1),
        [&]() { return m_Transport.Post(target, body, "text/plain"); }
    );

    if (!response.has_value())
    {
        std::cerr << "Error: chunk " << Batch.Index + 1 << " failed, marking " << Batch.Size() << " hashes as failed" << std::endl;
        for (auto& record : Batch.Records)
        {
            results.push_back(LookupResult::Failed(record.Hash));
        }
        return results;
    }

    if (response->Status == HTTP_STATUS_NO_CONTENT)
    {
        for (auto& record : Batch.Records)
        {
            results.push_back(LookupResult::NotFound(record.Hash));
        }
        return results;
    }

    auto parsed = ParseLookupResponse(response->Body);
    size_t missing = 0;

    // Reassemble in request order, whatever order the service answered in
    for (auto& record : Batch.Records)
    {
        auto it = parsed.find(record.Hash);
        if (it == parsed.end())
        {
            missing++;
            results.push_back(m_MissingAsFailed ? LookupResult::Failed(record.Hash) : LookupResult::NotFound(record.Hash));
        }
        else if (it->second.has_value())
        {
            results.push_back(LookupResult::Found(record.Hash, *it->second));
        }
        else
        {
            results.push_back(LookupResult::NotFound(record.Hash));
        }
    }

    DCHECK_EQ(results.size(), Batch.Size());

    if (missing > 0)
    {
        m_Missing += missing;
        std::cerr << "Warning: response for chunk " << Batch.Index + 1 << " omitted " << missing << " of " << Batch.Size()
                  << " hashes, recorded as " << (m_MissingAsFailed ? "failed" : "not found") << std::endl;
    }

    return results;
}

const LookupResult
LookupClient::LookupSingle(
    const std::string& Hash,
    const HashType Type
)
{
    const std::string hash = Util::ToLower(Util::Trim(Hash));

    if (!IsHashOfType(hash, Type))
    {
        std::cerr << "Warning: \"" << hash << "\" does not look like a " << HashTypeToString(Type) << " hash" << std::endl;
    }

    const std::string target = std::string("/") + HashTypeToString(Type) + "/" + hash;
    auto response = SendWithRetry(
        "hash " + hash,
        [&]() { return m_Transport.Get(target); }
    );

    if (!response.has_value())
    {
        return LookupResult::Failed(hash);
    }

    if (response->Status == HTTP_STATUS_NO_CONTENT)
    {
        return LookupResult::NotFound(hash);
    }

    auto parsed = ParseLookupResponse(response->Body);
    auto it = parsed.find(hash);
    if (it == parsed.end())
    {
        m_Missing++;
        std::cerr << "Warning: response did not mention " << hash << std::endl;
        return m_MissingAsFailed ? LookupResult::Failed(hash) : LookupResult::NotFound(hash);
    }

    if (it->second.has_value())
    {
        return LookupResult::Found(hash, *it->second);
    }

    return LookupResult::NotFound(hash);
}
