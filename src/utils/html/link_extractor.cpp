#include "link_extractor.hpp"
#include <gumbo.h>
#include <unordered_set>
#include "../text/string_utils.hpp"
#include "../url/url.hpp"

namespace Arachne {
namespace Utils {
namespace Html {

namespace {

void collect_links(GumboNode* node, LinkExtractor::Hrefs& hrefs) {
    if (node->type != GUMBO_NODE_ELEMENT)
        return;

    GumboTag tag = node->v.element.tag;
    if (tag == GUMBO_TAG_A || (tag == GUMBO_TAG_BASE && hrefs.base.empty())) {
        GumboAttribute* href = gumbo_get_attribute(&node->v.element.attributes, "href");
        if (href) {
            if (tag == GUMBO_TAG_A)
                hrefs.links.emplace_back(href->value);
            else
                hrefs.base = href->value;
        }
    }

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_links(static_cast<GumboNode*>(children->data[i]), hrefs);
    }
}

std::string domain_of(const std::string& url) {
    std::string host = Text::to_lower(Url::parse(url).host);
    while (!host.empty() && host.back() == '.')
        host.pop_back();
    if (host.rfind("www.", 0) == 0)
        host.erase(0, 4);
    return host;
}

bool is_subdomain_of(const std::string& host, const std::string& domain) {
    return host.size() > domain.size() + 1
           && host.compare(host.size() - domain.size(), domain.size(), domain) == 0
           && host[host.size() - domain.size() - 1] == '.';
}

}  // namespace

std::string to_string(LinkScope scope) {
    switch (scope) {
        case LinkScope::Root:
            return "ROOT";
        case LinkScope::SameDomain:
            return "SAME_DOMAIN";
        case LinkScope::DifferentSubDomain:
            return "DIFFERENT_SUBDOMAIN";
        case LinkScope::External:
            return "EXTERNAL";
    }
    return "UNKNOWN";
}

LinkExtractor::Hrefs LinkExtractor::collect_hrefs(const std::string& html) {
    Hrefs hrefs;
    if (html.empty())
        return hrefs;

    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    collect_links(output->root, hrefs);
    gumbo_destroy_output(&kGumboDefaultOptions, output);

    return hrefs;
}

std::vector<std::string> LinkExtractor::extract(const std::string& base_url,
                                                const std::string& html) {
    std::vector<std::string> result;
    Hrefs                    hrefs = collect_hrefs(html);
    if (hrefs.links.empty())
        return result;

    std::string document_base = base_url;
    if (!hrefs.base.empty()) {
        std::string resolved_base = Url::resolve(base_url, hrefs.base);
        if (Url::is_http_scheme(Url::parse(resolved_base).scheme))
            document_base = resolved_base;
    }

    std::unordered_set<std::string> seen;
    for (const auto& raw_href : hrefs.links) {
        std::string href = Text::trim(raw_href);
        if (href.empty() || href[0] == '#')
            continue;

        std::string absolute = Url::resolve(document_base, href);
        if (absolute.empty() || !Url::is_http_scheme(Url::parse(absolute).scheme))
            continue;

        std::string normalized = Url::normalize(absolute);
        if (normalized.empty())
            continue;
        if (seen.insert(normalized).second)
            result.push_back(std::move(normalized));
    }
    return result;
}

LinkScope LinkExtractor::scope_of(const std::string& seed_url, const std::string& link) {
    std::string seed_domain = domain_of(seed_url);
    std::string link_domain = domain_of(link);
    if (seed_domain.empty() || link_domain.empty())
        return LinkScope::External;

    if (link_domain == seed_domain) {
        UrlParsed parsed = Url::parse(link);
        if ((parsed.path.empty() || parsed.path == "/") && parsed.query.empty())
            return LinkScope::Root;
        return LinkScope::SameDomain;
    }
    if (is_subdomain_of(link_domain, seed_domain) || is_subdomain_of(seed_domain, link_domain))
        return LinkScope::DifferentSubDomain;
    return LinkScope::External;
}

std::vector<Link> LinkExtractor::classify(const std::string&              seed_url,
                                          const std::vector<std::string>& links) {
    std::vector<Link> result;
    result.reserve(links.size());
    for (const auto& url : links)
        result.push_back(Link{url, scope_of(seed_url, url)});
    return result;
}

}  // namespace Html
}  // namespace Utils
}  // namespace Arachne
