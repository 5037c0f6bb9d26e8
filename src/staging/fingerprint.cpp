#include "stager/staging/fingerprint.hpp"

#include "stager/staging/resource.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

namespace stager::staging {
namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

std::string to_hex(const unsigned char* data, std::size_t size) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace

struct ContentHasher::Context {
    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> digest{EVP_MD_CTX_new()};
};

ContentHasher::ContentHasher() : context_(std::make_unique<Context>()) {
    healthy_ = context_->digest && EVP_DigestInit_ex(context_->digest.get(), EVP_md5(), nullptr) == 1;
}

ContentHasher::~ContentHasher() = default;

bool ContentHasher::update(const std::uint8_t* data, std::size_t size) noexcept {
    healthy_ = healthy_ && EVP_DigestUpdate(context_->digest.get(), data, size) == 1;
    if (healthy_) {
        bytes_seen_ += size;
    }
    return healthy_;
}

std::optional<Fingerprint> ContentHasher::finish() noexcept {
    if (!healthy_) {
        return std::nullopt;
    }
    healthy_ = false;

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context_->digest.get(), digest.data(), &length) != 1) {
        return std::nullopt;
    }
    return Fingerprint{to_hex(digest.data(), length), bytes_seen_};
}

stager::Result<Fingerprint> Fingerprinter::fingerprint(const ResourceSource& source) const {
    ContentHasher hasher;
    auto hashed = for_each_chunk(source, kReadChunkSize,
        [&](const std::uint8_t* data, std::size_t size) -> stager::Result<void> {
            if (!hasher.update(data, size)) {
                return stager::Err<void>(ErrorKind::FingerprintFailed,
                                         "MD5 update failed for " + describe_source(source));
            }
            return stager::Ok();
        });
    if (hashed.is_error()) {
        return stager::Err<Fingerprint>(hashed.error());
    }

    auto fingerprint = hasher.finish();
    if (!fingerprint) {
        return stager::Err<Fingerprint>(ErrorKind::FingerprintFailed,
                                        "MD5 finalisation failed for " + describe_source(source));
    }
    return stager::Ok(std::move(*fingerprint));
}

stager::Result<Fingerprint> Fingerprinter::fingerprint(const ByteBuffer& bytes) const {
    ContentHasher hasher;
    for (std::size_t offset = 0; offset < bytes.size(); offset += kReadChunkSize) {
        const std::size_t count = std::min(kReadChunkSize, bytes.size() - offset);
        if (!hasher.update(bytes.data() + offset, count)) {
            return stager::Err<Fingerprint>(ErrorKind::FingerprintFailed, "MD5 update failed for buffer");
        }
    }

    auto fingerprint = hasher.finish();
    if (!fingerprint) {
        return stager::Err<Fingerprint>(ErrorKind::FingerprintFailed, "MD5 finalisation failed for buffer");
    }
    return stager::Ok(std::move(*fingerprint));
}

std::string unique_content_name(const std::string& logical_name, const Fingerprint& fingerprint) {
    return logical_name + "-" + fingerprint.hex;
}

std::string destination_key(const std::string& staging_location,
                            const std::string& logical_name,
                            const Fingerprint& fingerprint) {
    std::string key = staging_location;
    if (key.empty() || key.back() != '/') {
        key += '/';
    }
    return key + unique_content_name(logical_name, fingerprint);
}

} // namespace stager::staging
