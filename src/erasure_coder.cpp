#include "erasure_coder.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <jerasure.h>
#include <reed_sol.h>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>

namespace {
std::once_flag g_field_once;
}

void init_galois_field() {
    std::call_once(g_field_once, []() {
        int rc = galois_init_default_field(8);
        if (rc != 0) {
            throw VaultError(ErrorCode::Unknown, "galois_init_default_field(8) failed: " + std::to_string(rc));
        }
        LOG_DEBUG("FEC", "GF(2^8) field ready");
    });
}

ErasureCoder::ErasureCoder(int k, int r, int w)
    : k_(k), r_(r), w_(w) {
    if (w_ != 8) throw VaultError(ErrorCode::Unknown, "Only w=8 stripes are supported");
    init_galois_field();
    matrix_ = reed_sol_vandermonde_coding_matrix(k_, r_, w_);
    if (!matrix_) throw VaultError(ErrorCode::Unknown, "Failed to create coding matrix");
}

ErasureCoder::~ErasureCoder() {
    if (matrix_) free(matrix_);
}

void ErasureCoder::check_layout(const std::vector<uint8_t>& stripes, size_t stripe_len) const {
    // jerasure works on whole machine words with w=8
    if (stripe_len == 0 || stripe_len % sizeof(long) != 0) {
        throw VaultError(ErrorCode::Unknown, "Stripe length must be a non-zero multiple of " +
                                             std::to_string(sizeof(long)));
    }
    if (stripes.size() != static_cast<size_t>(k_ + r_) * stripe_len) {
        throw VaultError(ErrorCode::Unknown, "Stripe buffer holds " + std::to_string(stripes.size()) +
                                             " bytes, expected " +
                                             std::to_string(static_cast<size_t>(k_ + r_) * stripe_len));
    }
}

void ErasureCoder::encode(std::vector<uint8_t>& stripes, size_t stripe_len) const {
    check_layout(stripes, stripe_len);

    std::vector<char*> data_ptrs(k_);
    std::vector<char*> code_ptrs(r_);
    char* base = reinterpret_cast<char*>(stripes.data());
    for (int i = 0; i < k_; ++i) data_ptrs[i] = base + i * stripe_len;
    for (int i = 0; i < r_; ++i) code_ptrs[i] = base + (k_ + i) * stripe_len;

    jerasure_matrix_encode(k_, r_, w_, matrix_, data_ptrs.data(), code_ptrs.data(),
                           static_cast<int>(stripe_len));
}

bool ErasureCoder::decode(std::vector<uint8_t>& stripes, size_t stripe_len,
                          const std::vector<bool>& erased) const {
    check_layout(stripes, stripe_len);
    if (erased.size() != static_cast<size_t>(k_ + r_)) {
        LOG_ERROR("FEC", "Invalid erasure flags size: " << erased.size() << " != " << (k_ + r_));
        return false;
    }

    std::vector<int> erasures;
    for (int i = 0; i < k_ + r_; ++i) {
        if (erased[i]) erasures.push_back(i);
    }
    if (erasures.empty()) return true;

    if (erasures.size() > static_cast<size_t>(r_)) {
        LOG_WARN("FEC", "Too many erased stripes: " << erasures.size() << " > " << r_);
        return false;
    }
    erasures.push_back(-1); // terminator

    // Decode into a scratch copy so a refused decode leaves the caller's bytes intact
    std::vector<uint8_t> working = stripes;
    std::vector<char*> data_ptrs(k_);
    std::vector<char*> code_ptrs(r_);
    char* base = reinterpret_cast<char*>(working.data());
    for (int i = 0; i < k_; ++i) data_ptrs[i] = base + i * stripe_len;
    for (int i = 0; i < r_; ++i) code_ptrs[i] = base + (k_ + i) * stripe_len;

    int ret = jerasure_matrix_decode(k_, r_, w_, matrix_, 0, erasures.data(),
                                     data_ptrs.data(), code_ptrs.data(),
                                     static_cast<int>(stripe_len));
    if (ret < 0) {
        LOG_WARN("FEC", "Decode failed with error: " << ret);
        return false;
    }

    stripes.swap(working);
    LOG_DEBUG("FEC", "Rebuilt " << (erasures.size() - 1) << " stripe(s)");
    return true;
}

bool ErasureCoder::parity_consistent(const std::vector<uint8_t>& stripes, size_t stripe_len) const {
    std::vector<uint8_t> recomputed = stripes;
    encode(recomputed, stripe_len);
    const size_t parity_offset = static_cast<size_t>(k_) * stripe_len;
    return std::memcmp(recomputed.data() + parity_offset, stripes.data() + parity_offset,
                       static_cast<size_t>(r_) * stripe_len) == 0;
}
