#pragma once
#include <string>
#include <vector>

namespace Arachne {
namespace Utils {
namespace Html {

// Where a link points relative to the domain a crawl started from.
enum class LinkScope { Root, SameDomain, DifferentSubDomain, External };

std::string to_string(LinkScope scope);

struct Link {
    std::string url;
    LinkScope   scope = LinkScope::External;
};

class LinkExtractor {
public:
    // Raw href values of every <a> element, plus the first <base href> if any.
    struct Hrefs {
        std::string              base;
        std::vector<std::string> links;
    };

    static Hrefs collect_hrefs(const std::string& html);

    // Absolute, normalized, http(s)-only links in document order, without
    // duplicates. base_url must be the final URL of the fetched page.
    static std::vector<std::string> extract(const std::string& base_url, const std::string& html);

    // A leading "www." is ignored on both hosts; ports are not compared.
    static LinkScope         scope_of(const std::string& seed_url, const std::string& link);
    static std::vector<Link> classify(const std::string&              seed_url,
                                      const std::vector<std::string>& links);

    static bool in_seed_domain(LinkScope scope) {
        return scope != LinkScope::External;
    }
};

}  // namespace Html
}  // namespace Utils
}  // namespace Arachne
