#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <zstd.h>

// Downstream consumer of a byte stream (chunker, output file, ...)
using ByteSink = std::function<void(const uint8_t*, size_t)>;

// zstd frame magic (ZSTD_MAGICNUMBER, little endian). The only thing embedded
// in a payload to describe it.
constexpr uint8_t kCompressionMagic[4] = {0x28, 0xB5, 0x2F, 0xFD};
constexpr size_t kCompressionMagicSize = sizeof(kCompressionMagic);

bool has_compression_magic(const uint8_t* data, size_t n);

// ----------------------------------------------------------------------------
// SHA-256 over OpenSSL EVP
// ----------------------------------------------------------------------------
class Sha256Hasher {
public:
    Sha256Hasher();
    void update(const uint8_t* data, size_t n);
    std::string finish_hex();   // 64 lowercase hex chars, hasher is spent afterwards

private:
    struct CtxDeleter { void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); } };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
    bool finished_ = false;
};

std::string sha256_hex(const uint8_t* data, size_t n);
std::string file_sha256(const std::string& path);   // throws InvalidInputError / IoError

// ----------------------------------------------------------------------------
// Streaming zstd
// ----------------------------------------------------------------------------
class PayloadCompressor {
public:
    explicit PayloadCompressor(int level);
    void compress(const uint8_t* data, size_t n, const ByteSink& out);
    void finish(const ByteSink& out);

private:
    struct CCtxDeleter { void operator()(ZSTD_CCtx* c) const { ZSTD_freeCCtx(c); } };
    std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx_;
    std::vector<uint8_t> out_buf_;
};

class PayloadDecompressor {
public:
    PayloadDecompressor();
    void decompress(const uint8_t* data, size_t n, const ByteSink& out);
    // Throws DecodingError when the zstd frame was not complete
    void finish() const;

private:
    struct DCtxDeleter { void operator()(ZSTD_DCtx* d) const { ZSTD_freeDCtx(d); } };
    std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx_;
    std::vector<uint8_t> out_buf_;
    size_t last_hint_ = 1;   // 0 once a frame has been fully decoded
    bool fed_ = false;
};

// ----------------------------------------------------------------------------
// Encode side: original bytes -> (hash) -> optional zstd -> payload sink
// ----------------------------------------------------------------------------
class PayloadPreparer {
public:
    PayloadPreparer(bool use_compression, int level, ByteSink payload_out);

    void feed(const uint8_t* data, size_t n);
    void finish();

    uint64_t original_size() const { return original_size_; }
    uint64_t payload_size() const { return payload_size_; }
    bool compressed() const { return compressor_ != nullptr; }
    const std::string& checksum() const { return checksum_; }   // valid after finish()

private:
    void emit(const uint8_t* data, size_t n);

    bool use_compression_;
    int level_;
    ByteSink payload_out_;
    Sha256Hasher hasher_;
    std::unique_ptr<PayloadCompressor> compressor_;   // created on first non-empty feed
    uint64_t original_size_ = 0;
    uint64_t payload_size_ = 0;
    std::string checksum_;
};

// ----------------------------------------------------------------------------
// Decode side: payload bytes -> magic detection -> optional unzstd -> (hash) -> sink
// ----------------------------------------------------------------------------
class PayloadRestorer {
public:
    PayloadRestorer(bool use_compression, ByteSink output);

    void feed(const uint8_t* data, size_t n);
    // Flushes held-back bytes, checks zstd frame completion, returns hex digest
    const std::string& finish();

    bool decompressing() const { return mode_ == Mode::Zstd; }
    bool mode_known() const { return mode_ != Mode::Undecided; }
    uint64_t restored_size() const { return restored_size_; }
    const std::string& checksum() const { return checksum_; }

private:
    enum class Mode { Undecided, Raw, Zstd };

    void decide(bool end_of_payload);
    void route(const uint8_t* data, size_t n);
    void write_out(const uint8_t* data, size_t n);

    bool use_compression_;
    ByteSink output_;
    Mode mode_ = Mode::Undecided;
    std::vector<uint8_t> head_;
    std::unique_ptr<PayloadDecompressor> decompressor_;
    Sha256Hasher hasher_;
    uint64_t restored_size_ = 0;
    std::string checksum_;
};

// Throws IntegrityError on mismatch; an empty expected digest means "not supplied"
void verify_checksum(const std::string& expected, const std::string& actual);
