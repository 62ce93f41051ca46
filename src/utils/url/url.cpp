#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <string_view>
#include <vector>
#include "../text/string_utils.hpp"

namespace Arachne {
namespace Utils {

namespace {

// RFC 3986 scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) followed by ':'
// before any '/', '?' or '#'.
std::string scheme_of(const std::string& url) {
    size_t colon = url.find(':');
    if (colon == std::string::npos || colon == 0)
        return "";
    if (!std::isalpha(static_cast<unsigned char>(url[0])))
        return "";
    for (size_t i = 1; i < colon; ++i) {
        unsigned char c = static_cast<unsigned char>(url[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
            return "";
    }
    return url.substr(0, colon);
}

std::string clean_host(std::string host) {
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    return Text::to_lower(host);
}

bool is_numeric(const std::string& s) {
    return !s.empty()
           && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string authority_of(const UrlParsed& parsed) {
    std::string auth = parsed.host;
    if (!parsed.port.empty())
        auth += ":" + parsed.port;
    return auth;
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    parsed.start_url = url;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = std::string(sv.substr(0, colon));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));

        if (end_auth != std::string_view::npos) {
            sv.remove_prefix(end_auth);
        }
        else {
            sv = "";
        }

        if (!authority.empty()) {
            size_t      at = authority.find_last_of('@');
            std::string host_port =
                (at != std::string::npos) ? authority.substr(at + 1) : authority;

            if (!host_port.empty() && host_port[0] == '[') {
                size_t end_bracket = host_port.find(']');
                if (end_bracket != std::string::npos) {
                    parsed.host    = host_port.substr(0, end_bracket + 1);
                    size_t p_colon = host_port.find(':', end_bracket + 1);
                    if (p_colon != std::string::npos) {
                        parsed.port = host_port.substr(p_colon + 1);
                    }
                }
                else {
                    parsed.host = host_port;
                }
            }
            else {
                size_t p_colon = host_port.find_last_of(':');
                if (p_colon != std::string::npos) {
                    parsed.host = host_port.substr(0, p_colon);
                    parsed.port = host_port.substr(p_colon + 1);
                }
                else {
                    parsed.host = host_port;
                }
            }
        }
    }

    size_t q_pos = sv.find('?');
    size_t h_pos = sv.find('#');
    if (q_pos != std::string_view::npos && h_pos != std::string_view::npos && q_pos > h_pos)
        q_pos = std::string_view::npos;

    size_t path_end = sv.length();
    if (q_pos != std::string_view::npos)
        path_end = std::min(path_end, q_pos);
    if (h_pos != std::string_view::npos)
        path_end = std::min(path_end, h_pos);

    parsed.path = std::string(sv.substr(0, path_end));
    if (q_pos != std::string_view::npos) {
        size_t q_end = (h_pos == std::string_view::npos) ? sv.length() : h_pos;
        parsed.query = std::string(sv.substr(q_pos + 1, q_end - q_pos - 1));
    }
    if (h_pos != std::string_view::npos)
        parsed.fragment = std::string(sv.substr(h_pos + 1));

    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::remove_dot_segments(const std::string& path) {
    if (path.empty())
        return "/";

    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    bool                     ends_as_dir = path.back() == '/';
    while (std::getline(ss, segment, '/')) {
        ends_as_dir = false;
        if (segment == "." || segment.empty()) {
            ends_as_dir = segment == ".";
            continue;
        }
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            ends_as_dir = true;
            continue;
        }
        segments.push_back(segment);
    }
    if (path.back() == '/')
        ends_as_dir = true;

    std::string normalized_path = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        normalized_path += segments[i];
        if (i < segments.size() - 1)
            normalized_path += "/";
    }
    if (ends_as_dir && normalized_path.back() != '/')
        normalized_path += "/";
    return normalized_path;
}

std::string Url::resolve(const std::string& base, const std::string& raw_relative) {
    std::string relative = Text::trim(raw_relative);
    if (relative.empty())
        return base;

    if (relative[0] == '#') {
        size_t frag = base.find('#');
        if (frag == std::string::npos)
            return base + relative;
        return base.substr(0, frag) + relative;
    }

    if (relative[0] == '?') {
        size_t cut = base.find_first_of("?#");
        return (cut == std::string::npos ? base : base.substr(0, cut)) + relative;
    }

    // Already absolute, whatever the scheme. Callers filter schemes.
    if (!scheme_of(relative).empty())
        return relative;

    UrlParsed base_parsed = parse(base);
    if (base_parsed.scheme.empty() || base_parsed.host.empty())
        return "";

    if (relative.size() >= 2 && relative[0] == '/' && relative[1] == '/') {
        return base_parsed.scheme + ":" + relative;
    }

    std::string result;
    if (relative[0] == '/') {
        result = base_parsed.scheme + "://" + authority_of(base_parsed) + relative;
    }
    else {
        std::string dir        = base_parsed.path;
        size_t      last_slash = dir.find_last_of('/');
        if (last_slash != std::string::npos) {
            dir = dir.substr(0, last_slash + 1);
        }
        else {
            dir = "/";
        }
        result = base_parsed.scheme + "://" + authority_of(base_parsed) + dir + relative;
    }

    size_t scheme_end = result.find("://");
    size_t domain_end = result.find('/', scheme_end + 3);
    if (domain_end == std::string::npos)
        domain_end = result.length();

    std::string path = result.substr(domain_end);
    std::string query_frag;
    size_t      qf = path.find_first_of("?#");
    if (qf != std::string::npos) {
        query_frag = path.substr(qf);
        path       = path.substr(0, qf);
    }

    return result.substr(0, domain_end) + remove_dot_segments(path) + query_frag;
}

std::string Url::normalize(const std::string& url) {
    UrlParsed parsed = parse(Text::trim(url));
    if (parsed.scheme.empty() || parsed.host.empty())
        return "";

    std::string scheme = Text::to_lower(parsed.scheme);
    std::string host   = clean_host(parsed.host);
    if (host.empty())
        return "";

    std::string port = parsed.port;
    if (!port.empty() && !is_numeric(port))
        return "";
    if (port == default_port(scheme))
        port.clear();

    std::string normalized = scheme + "://" + host;
    if (!port.empty())
        normalized += ":" + port;
    normalized += remove_dot_segments(parsed.path);
    if (!parsed.query.empty())
        normalized += "?" + parsed.query;
    return normalized;
}

std::string Url::origin(const std::string& url) {
    UrlParsed parsed = parse(url);
    if (parsed.scheme.empty() || parsed.host.empty())
        return "";

    std::string scheme = Text::to_lower(parsed.scheme);
    std::string result = scheme + "://" + clean_host(parsed.host);
    if (!parsed.port.empty() && parsed.port != default_port(scheme))
        result += ":" + parsed.port;
    return result;
}

std::string Url::host_key(const std::string& url) {
    UrlParsed parsed = parse(url);
    if (parsed.host.empty())
        return "";

    std::string key = clean_host(parsed.host);
    if (!parsed.port.empty() && parsed.port != default_port(Text::to_lower(parsed.scheme)))
        key += ":" + parsed.port;
    return key;
}

bool Url::is_http_scheme(const std::string& scheme) {
    std::string lower = Text::to_lower(scheme);
    return lower == "http" || lower == "https";
}

std::string Url::default_port(const std::string& scheme) {
    if (scheme == "http")
        return "80";
    if (scheme == "https")
        return "443";
    return "";
}

std::string Url::to_flat_filename(const std::string& url, const std::string& extension) {
    UrlParsed   p    = parse(url);
    std::string name = p.host;
    if (!p.port.empty())
        name += "_" + p.port;
    name += p.path;
    if (!p.query.empty())
        name += "_" + p.query;

    for (char& c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '?' || c == '&' || c == '=' || c == ':' || c == '\\' || c == '*'
            || c == '"' || c == '<' || c == '>' || c == '|' || std::iscntrl(uc))
            c = '_';
    }

    return name + extension;
}

}  // namespace Utils
}  // namespace Arachne
