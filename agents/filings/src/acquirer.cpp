#include "../include/acquirer.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/util.hpp"
#include <filesystem>

HttpDocumentAcquirer::HttpDocumentAcquirer(AcquireConfig cfg, std::shared_ptr<TokenBucket> limiter)
    : cfg_(std::move(cfg)), limiter_(std::move(limiter)) {
    if (!limiter_) throw std::invalid_argument("HttpDocumentAcquirer requires a rate limiter");
}

RawDocument HttpDocumentAcquirer::fetch(const std::string& locator) {
    limiter_->acquire();
    HttpResponse r;
    try {
        r = http_get(locator, cfg_.user_agent, cfg_.timeout_ms);
    } catch (const HttpTransportError& e) {
        throw AcquisitionError(e.timed_out() ? AcquireFailureMode::TransportTimeout : AcquireFailureMode::Transport,
                               locator + ": " + e.what());
    }
    if (r.status == 404 || r.status == 410) {
        throw AcquisitionError(AcquireFailureMode::NotFound, locator + ": not found (" + std::to_string(r.status) + ")");
    }
    if (r.status == 429) {
        throw AcquisitionError(AcquireFailureMode::RateLimited, locator + ": rate limited by source");
    }
    if (r.status >= 500) {
        throw AcquisitionError(AcquireFailureMode::Transport, locator + ": server error " + std::to_string(r.status));
    }
    if (r.status < 200 || r.status >= 300) {
        throw AcquisitionError(AcquireFailureMode::NotFound, locator + ": unexpected status " + std::to_string(r.status));
    }
    RawDocument doc;
    doc.locator = locator;
    doc.content_type = r.content_type.empty() ? guess_content_type(locator) : r.content_type;
    doc.bytes = std::move(r.body);
    return doc;
}

RawDocument FileDocumentAcquirer::fetch(const std::string& locator) {
    std::string path = locator.rfind("file://", 0) == 0 ? locator.substr(7) : locator;
    if (!std::filesystem::is_regular_file(path)) {
        throw AcquisitionError(AcquireFailureMode::NotFound, path + ": no such file");
    }
    RawDocument doc;
    doc.locator = locator;
    doc.content_type = guess_content_type(path);
    doc.bytes = read_text_file(path);
    return doc;
}

SchemeAcquirer::SchemeAcquirer(std::unique_ptr<DocumentAcquirer> http, std::unique_ptr<DocumentAcquirer> file)
    : http_(std::move(http)), file_(std::move(file)) {}

RawDocument SchemeAcquirer::fetch(const std::string& locator) {
    bool remote = locator.rfind("http://", 0) == 0 || locator.rfind("https://", 0) == 0;
    if (remote) {
        if (!http_) throw AcquisitionError(AcquireFailureMode::Transport, "no network acquirer configured");
        return http_->fetch(locator);
    }
    return file_->fetch(locator);
}

std::string guess_content_type(const std::string& path) {
    auto q = path.find('?');
    auto ext = to_lower(std::filesystem::path(path.substr(0, q)).extension().string());
    if (ext == ".htm" || ext == ".html" || ext == ".xhtml") return "text/html";
    if (ext == ".txt") return "text/plain";
    if (ext == ".pdf") return "application/pdf";
    return "application/octet-stream";
}
