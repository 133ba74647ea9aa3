#pragma once

#include <algorithm>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <cctype>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace scanpool {

    /**
     * @brief One HTTP response as seen by a scan request.
     *
     * Header names are stored lower-cased. Repeated headers keep the first
     * value received.
     */
    struct Response {
        int status_code{0};
        std::map<std::string, std::string, std::less<>> headers;
        std::string body;
        /** @brief False when the server asked to close the connection. */
        bool keep_alive{false};

        /// @brief Case-insensitive header lookup.
        std::optional<std::string> header(std::string_view name) const {
            std::string key(name);
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            auto it = headers.find(key);
            if (it == headers.end()) return std::nullopt;
            return it->second;
        }
    };

    inline Response parse_beast_response(
        boost::beast::http::response<boost::beast::http::string_body>&& msg) {
        Response out;
        out.status_code = static_cast<int>(msg.result_int());
        out.keep_alive = msg.keep_alive();

        for (auto const& field : msg.base()) {
            std::string name(field.name_string());
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            out.headers.emplace(std::move(name), std::string(field.value()));
        }

        out.body = std::move(msg.body());
        return out;
    }

}  // namespace scanpool
