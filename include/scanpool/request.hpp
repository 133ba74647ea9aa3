#pragma once
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <optional>
#include <string>
#include <unordered_map>

#include "scanpool/endpoint.hpp"
#include "scanpool/url.hpp"

namespace scanpool {

    /// @brief Verbs a scanner issues against a target.
    enum class HttpMethod {
        Get,
        Head,
        Post,
    };

    inline constexpr boost::beast::http::verb to_boost_http_method(
        HttpMethod method) {
        namespace http = boost::beast::http;
        switch (method) {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Head:
                return http::verb::head;
            case HttpMethod::Post:
                return http::verb::post;
        }
        return http::verb::unknown;
    }

    struct Request {
        HttpMethod method{HttpMethod::Get};
        std::string url;
        std::unordered_map<std::string, std::string> headers;
        std::optional<std::string> body;
    };

    /// @brief A request bound to the endpoint whose connection will carry it.
    struct PreparedRequest {
        EndpointKey endpoint;
        boost::beast::http::request<boost::beast::http::string_body> beast_req;
    };

    /// @brief Build the wire request for an already resolved URL.
    /// @note Uses `set()`, so duplicate header keys overwrite earlier ones.
    inline PreparedRequest prepare_request(const Request& req,
                                           const UrlComponents& url,
                                           const std::string& user_agent,
                                           const bool keep_alive = true) {
        namespace http = boost::beast::http;
        PreparedRequest out;
        out.endpoint = url.endpoint;

        auto& beast_req = out.beast_req;
        beast_req.version(11);
        beast_req.method(to_boost_http_method(req.method));
        beast_req.target(url.target);
        beast_req.set(http::field::host, url.endpoint.host);
        beast_req.set(http::field::user_agent, user_agent);
        beast_req.keep_alive(keep_alive);
        for (const auto& [k, v] : req.headers) {
            beast_req.set(k, v);
        }
        if (req.body.has_value()) {
            beast_req.body() = *req.body;
            beast_req.prepare_payload();
        }
        return out;
    }

}  // namespace scanpool
