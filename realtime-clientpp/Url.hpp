#ifndef REALTIME_CLIENTPP_URL_HPP
#define REALTIME_CLIENTPP_URL_HPP

#include "config.hpp"
#include "Error.hpp"

#include <cctype>
#include <map>

namespace REALTIME_CLIENTPP_NAMESPACE {
namespace lib {

/**
 * @brief Percent-encodes a query component (RFC 3986 unreserved set kept as-is)
 */
inline string percent_encode(const string& text) {
    static const char hex[] = "0123456789ABCDEF";
    string out;
    out.reserve(text.size() * 3);
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

/**
 * @brief Split form of an absolute ws://, wss://, http:// or https:// URL
 */
struct Url {
    string scheme;      ///< Lowercase scheme
    string host;
    string port;        ///< Explicit port or the scheme default
    string target;      ///< Path plus query, never empty

    bool is_secure() const {
        return scheme == "wss" || scheme == "https";
    }

    /**
     * @brief Path without the query string
     */
    string path() const {
        auto pos_q = target.find('?');
        return (pos_q == string::npos) ? target : target.substr(0, pos_q);
    }

    string to_string() const {
        return scheme + "://" + host + ":" + port + target;
    }

    /**
     * @brief Appends one encoded name=value pair to the target
     */
    void append_query(const string& name, const string& value) {
        target += (target.find('?') == string::npos) ? '?' : '&';
        target += percent_encode(name) + "=" + percent_encode(value);
    }

    /**
     * @brief Parses an absolute URL
     * @return false if the text is not a supported absolute URL
     */
    static bool try_parse(const string& text, Url& out) {
        auto sep = text.find("://");
        if (sep == string::npos || sep == 0) return false;

        Url url;
        url.scheme = text.substr(0, sep);
        for (auto& c : url.scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (url.scheme != "ws" && url.scheme != "wss" && url.scheme != "http" && url.scheme != "https") {
            return false;
        }

        auto rest = text.substr(sep + 3);
        auto slash = rest.find_first_of("/?");
        auto authority = rest.substr(0, slash);
        url.target = (slash == string::npos) ? "/" : rest.substr(slash);
        if (url.target[0] == '?') url.target = "/" + url.target;

        auto colon = authority.rfind(':');
        if (colon != string::npos && authority.find(']') == string::npos) {
            url.host = authority.substr(0, colon);
            url.port = authority.substr(colon + 1);
            if (url.port.empty()) return false;
            for (char c : url.port) {
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            }
        } else {
            url.host = authority;
            url.port = url.is_secure() ? "443" : "80";
        }
        if (url.host.empty()) return false;

        out = std::move(url);
        return true;
    }

    /**
     * @brief Parses an absolute URL
     * @throws RealtimeException with INVALID_CONFIG
     */
    static Url parse(const string& text) {
        Url url;
        if (!try_parse(text, url)) {
            throw RealtimeException("Invalid URL: '" + text + "'", RealtimeErrorCode::INVALID_CONFIG);
        }
        return url;
    }

    /**
     * @brief Resolves an endpoint against a base URL
     *
     * Absolute endpoints are returned as parsed; relative ones are joined
     * to the base path.
     */
    static Url resolve(const string& base, const string& endpoint) {
        Url url;
        if (try_parse(endpoint, url)) {
            return url;
        }
        url = parse(base);
        string base_path = url.path();
        if (!base_path.empty() && base_path.back() == '/') base_path.pop_back();
        url.target = base_path + ((!endpoint.empty() && endpoint[0] == '/') ? endpoint : "/" + endpoint);
        return url;
    }
};

}
}

#endif // REALTIME_CLIENTPP_URL_HPP
