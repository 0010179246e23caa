//
//  HttpTransport.hpp
//  HashLookup
//
//  Created by Kryc on 19/10/2026.
//  Copyright © 2026 Kryc. All rights reserved.
//

#ifndef HttpTransport_hpp
#define HttpTransport_hpp

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#define HTTP_STATUS_OK 200
#define HTTP_STATUS_NO_CONTENT 204

struct HttpResponse
{
    unsigned Status;
    std::string Body;
};

//
// Request/response seam between the lookup client and the network.
// Targets are relative to the service URL (e.g. "/nt/<hash>" or
// "?hashtype=nt"). A transport failure (resolve, connect, TLS, read,
// write or timeout) is reported as std::nullopt.
//
class HttpTransport
{
public:
    virtual ~HttpTransport(void) = default;
    virtual std::optional<HttpResponse> Get(const std::string& Target) = 0;
    virtual std::optional<HttpResponse> Post(const std::string& Target, const std::string& Body, const std::string& ContentType) = 0;
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

struct ServiceUrl
{
    bool Tls = true;
    std::string Host;
    std::string Port;
    std::string Path;
};

// Accepts http:// and https:// URLs with an optional port and path
const std::optional<ServiceUrl>
ParseServiceUrl(
    const std::string_view Url
);

class HttpsTransport : public HttpTransport
{
public:
    HttpsTransport(const ServiceUrl& Url, const std::chrono::milliseconds Timeout) : m_Url(Url), m_Timeout(Timeout) {}
    std::optional<HttpResponse> Get(const std::string& Target) override;
    std::optional<HttpResponse> Post(const std::string& Target, const std::string& Body, const std::string& ContentType) override;
    const ServiceUrl& GetUrl(void) const { return m_Url; }
    const std::chrono::milliseconds GetTimeout(void) const { return m_Timeout; }
private:
    std::optional<HttpResponse> Request(const bool IsPost, const std::string& Target, const std::string& Body, const std::string& ContentType);
    ServiceUrl m_Url;
    std::chrono::milliseconds m_Timeout;
};

#endif /* HttpTransport_hpp */
