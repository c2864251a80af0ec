#include "payload.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>

namespace {

std::string to_hex(const unsigned char* bytes, size_t n) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(n * 2);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(digits[bytes[i] >> 4]);
        out.push_back(digits[bytes[i] & 0x0F]);
    }
    return out;
}

std::string zstd_error(size_t rc) {
    return std::string(ZSTD_getErrorName(rc));
}

} // namespace

bool has_compression_magic(const uint8_t* data, size_t n) {
    return n >= kCompressionMagicSize &&
           std::memcmp(data, kCompressionMagic, kCompressionMagicSize) == 0;
}

// ---------------------- Sha256Hasher ----------------------

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw VaultError(ErrorCode::Unknown, "EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw VaultError(ErrorCode::Unknown, "EVP_DigestInit_ex(sha256) failed");
    }
}

void Sha256Hasher::update(const uint8_t* data, size_t n) {
    if (n == 0) return;
    if (finished_) throw VaultError(ErrorCode::Unknown, "SHA-256 hasher reused after finish");
    if (EVP_DigestUpdate(ctx_.get(), data, n) != 1) {
        throw VaultError(ErrorCode::Unknown, "EVP_DigestUpdate failed");
    }
}

std::string Sha256Hasher::finish_hex() {
    if (finished_) throw VaultError(ErrorCode::Unknown, "SHA-256 hasher finished twice");
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &len) != 1) {
        throw VaultError(ErrorCode::Unknown, "EVP_DigestFinal_ex failed");
    }
    finished_ = true;
    return to_hex(digest, len);
}

std::string sha256_hex(const uint8_t* data, size_t n) {
    Sha256Hasher h;
    h.update(data, n);
    return h.finish_hex();
}

std::string file_sha256(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw InvalidInputError("Cannot open file for hashing: " + path);

    Sha256Hasher h;
    std::vector<char> buffer(1024 * 1024);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0) h.update(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<size_t>(got));
    }
    if (in.bad()) throw IoError("Read failed while hashing " + path);
    return h.finish_hex();
}

void verify_checksum(const std::string& expected, const std::string& actual) {
    if (expected.empty()) return;
    std::string lower = expected;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower != actual) throw IntegrityError(lower, actual);
}

// ---------------------- PayloadCompressor ----------------------

PayloadCompressor::PayloadCompressor(int level)
    : cctx_(ZSTD_createCCtx()), out_buf_(ZSTD_CStreamOutSize()) {
    if (!cctx_) throw EncodingError("ZSTD_createCCtx failed");

    size_t rc = ZSTD_CCtx_setParameter(cctx_.get(), ZSTD_c_compressionLevel, level);
    if (ZSTD_isError(rc)) throw EncodingError("zstd level " + std::to_string(level) + ": " + zstd_error(rc));

    // frame-level content checksum: a second corruption gate on decode
    rc = ZSTD_CCtx_setParameter(cctx_.get(), ZSTD_c_checksumFlag, 1);
    if (ZSTD_isError(rc)) throw EncodingError("zstd checksum flag: " + zstd_error(rc));
}

void PayloadCompressor::compress(const uint8_t* data, size_t n, const ByteSink& out) {
    ZSTD_inBuffer in{data, n, 0};
    while (in.pos < in.size) {
        ZSTD_outBuffer ob{out_buf_.data(), out_buf_.size(), 0};
        size_t rc = ZSTD_compressStream2(cctx_.get(), &ob, &in, ZSTD_e_continue);
        if (ZSTD_isError(rc)) throw EncodingError("Zstd compression failed: " + zstd_error(rc));
        if (ob.pos > 0) out(out_buf_.data(), ob.pos);
    }
}

void PayloadCompressor::finish(const ByteSink& out) {
    size_t remaining = 0;
    do {
        ZSTD_inBuffer in{nullptr, 0, 0};
        ZSTD_outBuffer ob{out_buf_.data(), out_buf_.size(), 0};
        remaining = ZSTD_compressStream2(cctx_.get(), &ob, &in, ZSTD_e_end);
        if (ZSTD_isError(remaining)) throw EncodingError("Zstd flush failed: " + zstd_error(remaining));
        if (ob.pos > 0) out(out_buf_.data(), ob.pos);
    } while (remaining != 0);
}

// ---------------------- PayloadDecompressor ----------------------

PayloadDecompressor::PayloadDecompressor()
    : dctx_(ZSTD_createDCtx()), out_buf_(ZSTD_DStreamOutSize()) {
    if (!dctx_) throw DecodingError("ZSTD_createDCtx failed");
}

void PayloadDecompressor::decompress(const uint8_t* data, size_t n, const ByteSink& out) {
    if (n == 0) return;
    fed_ = true;
    ZSTD_inBuffer in{data, n, 0};
    while (true) {
        ZSTD_outBuffer ob{out_buf_.data(), out_buf_.size(), 0};
        size_t rc = ZSTD_decompressStream(dctx_.get(), &ob, &in);
        if (ZSTD_isError(rc)) throw DecodingError("Zstd decompression failed: " + zstd_error(rc));
        last_hint_ = rc;
        if (ob.pos > 0) out(out_buf_.data(), ob.pos);
        // output buffer not full and input drained -> nothing left buffered
        if (in.pos == in.size && ob.pos < ob.size) break;
    }
}

void PayloadDecompressor::finish() const {
    if (!fed_ || last_hint_ != 0) {
        throw DecodingError("Compressed payload is truncated (zstd frame incomplete)");
    }
}

// ---------------------- PayloadPreparer ----------------------

PayloadPreparer::PayloadPreparer(bool use_compression, int level, ByteSink payload_out)
    : use_compression_(use_compression), level_(level), payload_out_(std::move(payload_out)) {}

void PayloadPreparer::emit(const uint8_t* data, size_t n) {
    payload_size_ += n;
    payload_out_(data, n);
}

void PayloadPreparer::feed(const uint8_t* data, size_t n) {
    if (n == 0) return;
    hasher_.update(data, n);
    original_size_ += n;

    if (!use_compression_) {
        emit(data, n);
        return;
    }
    if (!compressor_) compressor_ = std::make_unique<PayloadCompressor>(level_);
    compressor_->compress(data, n, [this](const uint8_t* p, size_t k) { emit(p, k); });
}

void PayloadPreparer::finish() {
    if (compressor_) {
        compressor_->finish([this](const uint8_t* p, size_t k) { emit(p, k); });
    } else if (use_compression_) {
        LOG_DEBUG("PAYLOAD", "empty input, no compression frame emitted");
    }
    checksum_ = hasher_.finish_hex();

    LOG_INFO("PAYLOAD", "original " << original_size_ << " bytes -> payload " << payload_size_
             << " bytes" << (compressor_ ? " (zstd)" : " (raw)") << ", sha256 " << checksum_);
}

// ---------------------- PayloadRestorer ----------------------

PayloadRestorer::PayloadRestorer(bool use_compression, ByteSink output)
    : use_compression_(use_compression), output_(std::move(output)) {}

void PayloadRestorer::write_out(const uint8_t* data, size_t n) {
    hasher_.update(data, n);
    restored_size_ += n;
    output_(data, n);
}

void PayloadRestorer::route(const uint8_t* data, size_t n) {
    if (n == 0) return;
    if (mode_ == Mode::Zstd) {
        decompressor_->decompress(data, n, [this](const uint8_t* p, size_t k) { write_out(p, k); });
    } else {
        write_out(data, n);
    }
}

void PayloadRestorer::decide(bool end_of_payload) {
    if (use_compression_ && has_compression_magic(head_.data(), head_.size())) {
        mode_ = Mode::Zstd;
        decompressor_ = std::make_unique<PayloadDecompressor>();
        LOG_DEBUG("PAYLOAD", "compression magic found, decompressing");
    } else {
        mode_ = Mode::Raw;
        if (use_compression_ && !head_.empty()) {
            LOG_INFO("PAYLOAD", "no compression magic in payload"
                     << (end_of_payload ? " (short payload)" : "") << ", treating as raw");
        }
    }
    std::vector<uint8_t> head;
    head.swap(head_);
    route(head.data(), head.size());
}

void PayloadRestorer::feed(const uint8_t* data, size_t n) {
    if (n == 0) return;
    if (mode_ != Mode::Undecided) {
        route(data, n);
        return;
    }

    size_t take = std::min(n, kCompressionMagicSize - head_.size());
    head_.insert(head_.end(), data, data + take);
    if (head_.size() < kCompressionMagicSize) return;

    decide(false);
    route(data + take, n - take);
}

const std::string& PayloadRestorer::finish() {
    if (mode_ == Mode::Undecided) decide(true);
    if (mode_ == Mode::Zstd) decompressor_->finish();
    checksum_ = hasher_.finish_hex();
    return checksum_;
}
