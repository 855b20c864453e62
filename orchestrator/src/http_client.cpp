#include "http_client.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

class CprHttpClient::Impl {
public:
    explicit Impl(std::string user_agent) : user_agent_(std::move(user_agent)) {}

    HttpResponse send(const HttpRequest& request) {
        cpr::Session session;
        session.SetUrl(cpr::Url{request.url});
        session.SetTimeout(cpr::Timeout{request.timeout});
        session.SetVerifySsl(cpr::VerifySsl{request.verify_tls});

        cpr::Header header{{"User-Agent", user_agent_}};
        for (const auto& [name, value] : request.headers) {
            header[name] = value;
        }
        if (!request.bearer_token.empty()) {
            header["Authorization"] = "Bearer " + request.bearer_token;
        }
        session.SetHeader(header);

        if (!request.username.empty()) {
            session.SetAuth(cpr::Authentication{request.username, request.password, cpr::AuthMode::BASIC});
        }

        if (!request.params.empty()) {
            cpr::Parameters parameters;
            for (const auto& [name, value] : request.params) {
                parameters.Add({name, value});
            }
            session.SetParameters(parameters);
        }

        if (!request.body.empty()) {
            session.SetBody(cpr::Body{request.body});
        }

        auto method = util::to_upper(request.method);
        cpr::Response response;
        if (method == "GET") {
            response = session.Get();
        } else if (method == "POST") {
            response = session.Post();
        } else if (method == "PUT") {
            response = session.Put();
        } else if (method == "PATCH") {
            response = session.Patch();
        } else if (method == "DELETE") {
            response = session.Delete();
        } else {
            HttpResponse unsupported;
            unsupported.error = "unsupported HTTP method " + request.method;
            return unsupported;
        }

        HttpResponse result;
        if (response.error) {
            spdlog::debug("{} {} failed: {}", method, request.url, response.error.message);
            result.error = response.error.message.empty() ? "transport error" : response.error.message;
            return result;
        }

        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

private:
    std::string user_agent_;
};

CprHttpClient::CprHttpClient(std::string user_agent)
    : pImpl_(std::make_unique<Impl>(std::move(user_agent))) {}

CprHttpClient::~CprHttpClient() = default;

HttpResponse CprHttpClient::send(const HttpRequest& request) {
    return pImpl_->send(request);
}
