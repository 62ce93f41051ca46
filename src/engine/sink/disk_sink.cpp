#include "disk_sink.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <openssl/evp.h>
#include <stdexcept>
#include <sstream>
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Arachne {
namespace Engine {

using Arachne::Core::Logger;

namespace {
constexpr const char* SUMMARY_FILE   = "_run.json";
constexpr const char* JSON_EXTENSION = ".json";
constexpr std::size_t MAX_PREFIX     = 96;
constexpr std::size_t DIGEST_BYTES   = 8;

std::string url_digest(const std::string& url) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int  length = 0;
    if (EVP_Digest(url.data(), url.size(), digest, &length, EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("SHA-256 failed for " + url);

    std::ostringstream hex;
    for (std::size_t i = 0; i < DIGEST_BYTES && i < length; ++i)
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return hex.str();
}
}  // namespace

DiskSink::DiskSink(const std::string& base_path) : base_path_(base_path) {
    if (!base_path_.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(base_path_, ec);
        if (ec)
            Logger::error("Failed to create output directory: " + base_path_ + " ("
                          + ec.message() + ")");
    }
}

std::string DiskSink::file_name(const std::string& url) {
    std::string prefix = Arachne::Utils::Url::to_flat_filename(url, "");
    if (prefix.size() > MAX_PREFIX)
        prefix.resize(MAX_PREFIX);
    return prefix + "_" + url_digest(url) + JSON_EXTENSION;
}

std::string DiskSink::file_for(const PageResult& result) {
    return result.run_id + "/" + file_name(result.url);
}

DeliveryResult DiskSink::deliver(const PageResult& result) {
    std::string key;
    try {
        key = file_for(result);
    } catch (const std::exception& e) {
        Logger::error("FS Error: " + std::string(e.what()));
        return DeliveryResult::Storage;
    }
    return save(key, to_payload(result));
}

DeliveryResult DiskSink::complete(const RunSummary& summary) {
    return save(summary.run_id + "/" + SUMMARY_FILE, to_payload(summary));
}

DeliveryResult DiskSink::save(const std::string& key, const std::string& content) {
    try {
        std::filesystem::path path(base_path_);
        path /= key;

        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path, std::ios::binary);
        if (!file.is_open()) {
            Logger::error("Write Error: " + path.string());
            return DeliveryResult::Storage;
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        Logger::success("Saved: " + path.string());
        return DeliveryResult::Ok;
    } catch (const std::exception& e) {
        Logger::error("FS Error: " + std::string(e.what()));
        return DeliveryResult::Storage;
    }
}

}  // namespace Engine
}  // namespace Arachne
