#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> params;
    std::string body;

    // Basic auth when username is set, bearer when token is set
    std::string username;
    std::string password;
    std::string bearer_token;

    std::chrono::milliseconds timeout{30000};
    bool verify_tls = true;
};

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;
    std::string error; // Set when no HTTP response was received

    bool transport_failed() const { return !error.empty() || status_code == 0; }
    bool ok() const { return !transport_failed() && status_code >= 200 && status_code < 300; }
};

// Outbound HTTP. Device transports and api_call steps go through this seam so
// tests can substitute canned responses.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Never throws for HTTP or transport failures; inspect the response
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

class CprHttpClient : public HttpClient {
public:
    explicit CprHttpClient(std::string user_agent = "netcomply/1.0");
    ~CprHttpClient() override;

    HttpResponse send(const HttpRequest& request) override;

    CprHttpClient(const CprHttpClient&) = delete;
    CprHttpClient& operator=(const CprHttpClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
