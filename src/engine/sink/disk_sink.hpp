#pragma once
#include <string>
#include "result_sink.hpp"

namespace Arachne {
namespace Engine {

// Writes one JSON file per page under <base>/<run_id>/ plus a _run.json
// summary. Used when a run has no callback URL.
class DiskSink : public ResultSink {
public:
    explicit DiskSink(const std::string& base_path);
    ~DiskSink() override = default;

    DeliveryResult deliver(const PageResult& result) override;
    DeliveryResult complete(const RunSummary& summary) override;

    // "<run_id>/<file_name(url)>"
    static std::string file_for(const PageResult& result);

    // Readable prefix of the URL, cut to a bounded length, followed by a
    // digest of the full URL so that distinct URLs never share a file.
    static std::string file_name(const std::string& url);

private:
    DeliveryResult save(const std::string& key, const std::string& content);

    std::string base_path_;
};

}  // namespace Engine
}  // namespace Arachne
