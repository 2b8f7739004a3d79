#pragma once
#include "config.hpp"
#include "models.hpp"
#include "rate_limiter.hpp"
#include <memory>
#include <string>

// Fetches raw filing bytes. Throws AcquisitionError.
class DocumentAcquirer {
public:
    virtual ~DocumentAcquirer() = default;
    virtual RawDocument fetch(const std::string& locator) = 0;
};

class HttpDocumentAcquirer : public DocumentAcquirer {
public:
    HttpDocumentAcquirer(AcquireConfig cfg, std::shared_ptr<TokenBucket> limiter);
    RawDocument fetch(const std::string& locator) override;

private:
    AcquireConfig cfg_;
    std::shared_ptr<TokenBucket> limiter_;
};

// file:// URLs and plain paths.
class FileDocumentAcquirer : public DocumentAcquirer {
public:
    RawDocument fetch(const std::string& locator) override;
};

// Sends http(s) locators to the network acquirer and everything else to disk.
class SchemeAcquirer : public DocumentAcquirer {
public:
    SchemeAcquirer(std::unique_ptr<DocumentAcquirer> http, std::unique_ptr<DocumentAcquirer> file);
    RawDocument fetch(const std::string& locator) override;

private:
    std::unique_ptr<DocumentAcquirer> http_;
    std::unique_ptr<DocumentAcquirer> file_;
};

std::string guess_content_type(const std::string& path);
