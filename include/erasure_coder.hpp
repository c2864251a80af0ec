#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>

#include "frame_geometry.hpp"

// gf_complete builds its default GF(2^w) field lazily on first use, and that
// first use is not thread-safe. Builds the w=8 field once per process; called
// by library_init() and by every ErasureCoder constructor.
void init_galois_field();

// Reed-Solomon (Vandermonde, GF(2^8)) over k data + r parity stripes that
// share one contiguous buffer: stripe i occupies [i * stripe_len, (i+1) * stripe_len).
class ErasureCoder {
public:
    ErasureCoder(int k = kDataStripes, int r = kParityStripes, int w = 8);
    ~ErasureCoder();

    ErasureCoder(const ErasureCoder&) = delete;
    ErasureCoder& operator=(const ErasureCoder&) = delete;

    int data_stripes() const { return k_; }
    int parity_stripes() const { return r_; }

    // Recomputes the parity stripes from the data stripes
    void encode(std::vector<uint8_t>& stripes, size_t stripe_len) const;

    // Rebuilds erased stripes in place. False when more than r stripes are
    // erased or jerasure refuses; the buffer is left as it was then.
    bool decode(std::vector<uint8_t>& stripes, size_t stripe_len,
                const std::vector<bool>& erased) const;

    // True when the stored parity matches the data stripes
    bool parity_consistent(const std::vector<uint8_t>& stripes, size_t stripe_len) const;

private:
    void check_layout(const std::vector<uint8_t>& stripes, size_t stripe_len) const;

    int k_, r_, w_;
    int* matrix_;
};
