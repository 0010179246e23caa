//
//  LookupClient.hpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#ifndef LookupClient_hpp
#define LookupClient_hpp

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Chunker.hpp"
#include "HashType.hpp"
#include "HttpTransport.hpp"
#include "LookupResult.hpp"
#include "Pacer.hpp"

#define DEFAULT_RETRIES 3
#define DEFAULT_PACING_MS 5000

// Hash (lowercase) to password, std::nullopt meaning "[not found]"
using ResponseMap = std::map<std::string, std::optional<std::string>>;

class LookupClient
{
public:
    LookupClient(HttpTransport& Transport, Pacer& Pacer) : m_Transport(Transport), m_Pacer(Pacer) {}
    void SetRetries(const size_t Retries) { m_Retries = Retries; }
    void SetRetryDelay(const std::chrono::milliseconds Delay) { m_RetryDelay = Delay; }
    void SetMissingAsFailed(const bool MissingAsFailed) { m_MissingAsFailed = MissingAsFailed; }
    const size_t GetRetries(void) const { return m_Retries; }
    const std::chrono::milliseconds GetRetryDelay(void) const { return m_RetryDelay; }
    const bool GetMissingAsFailed(void) const { return m_MissingAsFailed; }
    const size_t GetRequestCount(void) const { return m_Requests; }
    const size_t GetMissingCount(void) const { return m_Missing; }
    // One result per record, in chunk order
    const std::vector<LookupResult> LookupChunk(const Chunk& Batch, const HashType Type);
    const LookupResult LookupSingle(const std::string& Hash, const HashType Type);
private:
    std::optional<HttpResponse> SendWithRetry(const std::string& Description, const std::function<std::optional<HttpResponse>(void)>& Send);
    HttpTransport& m_Transport;
    Pacer& m_Pacer;
    size_t m_Retries = DEFAULT_RETRIES;
    std::chrono::milliseconds m_RetryDelay = std::chrono::milliseconds(DEFAULT_PACING_MS);
    bool m_MissingAsFailed = false;
    size_t m_Requests = 0;
    size_t m_Missing = 0;
};

// Parses "hash:password" / "hash:[not found]" lines
const ResponseMap
ParseLookupResponse(
    const std::string_view Body
);

#endif /* LookupClient_hpp */
