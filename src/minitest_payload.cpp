// Mini-tests: payload preparation (zstd + SHA-256), magic detection, chunking

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "errors.hpp"
#include "payload.hpp"
#include "slicer.hpp"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

static std::vector<uint8_t> make_text(size_t n) {
    static const char words[] = "pixel vault stores bytes in frames ";
    std::vector<uint8_t> out(n);
    for (size_t i = 0; i < n; ++i) out[i] = static_cast<uint8_t>(words[i % (sizeof(words) - 1)]);
    return out;
}

static std::vector<uint8_t> make_random(size_t n, uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<uint8_t> out(n);
    for (auto& b : out) b = static_cast<uint8_t>(rng() & 0xFF);
    return out;
}

// Prepares then restores, feeding both sides in uneven pieces
static bool prepare_restore(const std::vector<uint8_t>& input, bool compress, size_t piece,
                            std::vector<uint8_t>& payload, std::vector<uint8_t>& restored,
                            std::string& enc_sum, std::string& dec_sum) {
    payload.clear();
    restored.clear();
    PayloadPreparer prep(compress, 3, [&](const uint8_t* p, size_t n) { payload.insert(payload.end(), p, p + n); });
    for (size_t off = 0; off < input.size(); off += piece) {
        prep.feed(input.data() + off, std::min(piece, input.size() - off));
    }
    prep.finish();
    enc_sum = prep.checksum();
    T_ASSERT(prep.original_size() == input.size());
    T_ASSERT(prep.payload_size() == payload.size());

    PayloadRestorer rest(compress, [&](const uint8_t* p, size_t n) { restored.insert(restored.end(), p, p + n); });
    const size_t back_piece = piece / 3 + 1;
    for (size_t off = 0; off < payload.size(); off += back_piece) {
        rest.feed(payload.data() + off, std::min(back_piece, payload.size() - off));
    }
    dec_sum = rest.finish();
    T_ASSERT(rest.restored_size() == restored.size());
    return true;
}

// ------------------ TEST A : SHA-256 -----------------------------------------
static bool test_sha256() {
    const uint8_t abc[] = {'a', 'b', 'c'};
    T_ASSERT(sha256_hex(abc, 3) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    T_ASSERT(sha256_hex(nullptr, 0) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    Sha256Hasher split;
    split.update(abc, 1);
    split.update(abc + 1, 2);
    T_ASSERT(split.finish_hex() == sha256_hex(abc, 3));

    const std::string path = "minitest_payload_hash.bin";
    {
        std::ofstream f(path, std::ios::binary);
        f.write("abc", 3);
    }
    T_ASSERT(file_sha256(path) == sha256_hex(abc, 3));
    std::remove(path.c_str());

    bool threw = false;
    try {
        file_sha256("does/not/exist.bin");
    } catch (const InvalidInputError&) {
        threw = true;
    }
    T_ASSERT(threw);

    verify_checksum("", "anything");
    verify_checksum("BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD", sha256_hex(abc, 3));
    threw = false;
    try {
        verify_checksum(std::string(64, '0'), sha256_hex(abc, 3));
    } catch (const IntegrityError& e) {
        threw = e.code() == ErrorCode::DecodingError && e.actual() == sha256_hex(abc, 3);
    }
    T_ASSERT(threw);
    return true;
}

// ------------------ TEST B : compressed payloads -----------------------------
static bool test_compressed() {
    std::vector<uint8_t> payload, restored;
    std::string enc_sum, dec_sum;

    const auto text = make_text(200000);
    T_ASSERT(prepare_restore(text, true, 7777, payload, restored, enc_sum, dec_sum));
    T_ASSERT(has_compression_magic(payload.data(), payload.size()));
    T_ASSERT(payload.size() < text.size() / 10);
    T_ASSERT(restored == text);
    T_ASSERT(enc_sum == dec_sum);
    T_ASSERT(enc_sum == sha256_hex(text.data(), text.size()));

    // whole stream, one frame: a single magic at the start
    size_t magics = 0;
    for (size_t i = 0; i + 4 <= payload.size(); ++i) magics += has_compression_magic(payload.data() + i, 4);
    T_ASSERT(magics == 1);

    // tiny input still forms a complete frame
    const auto ten = make_random(10, 1);
    T_ASSERT(prepare_restore(ten, true, 3, payload, restored, enc_sum, dec_sum));
    T_ASSERT(restored == ten);
    T_ASSERT(payload.size() > ten.size());
    return true;
}

// ------------------ TEST C : raw payloads and magic rules --------------------
static bool test_raw_and_magic() {
    std::vector<uint8_t> payload, restored;
    std::string enc_sum, dec_sum;

    const auto data = make_random(5000, 2);
    T_ASSERT(prepare_restore(data, false, 999, payload, restored, enc_sum, dec_sum));
    T_ASSERT(payload == data);
    T_ASSERT(restored == data);

    // raw bytes that happen to start with the magic stay raw when compression is off
    std::vector<uint8_t> lookalike = {0x28, 0xB5, 0x2F, 0xFD, 0x01, 0x02};
    PayloadRestorer off(false, [&](const uint8_t* p, size_t n) { restored.assign(p, p + n); });
    off.feed(lookalike.data(), lookalike.size());
    off.finish();
    T_ASSERT(!off.decompressing());
    T_ASSERT(off.restored_size() == lookalike.size());

    // compression on, but no magic: treated as raw
    std::vector<uint8_t> out;
    PayloadRestorer on(true, [&](const uint8_t* p, size_t n) { out.insert(out.end(), p, p + n); });
    const std::vector<uint8_t> plain = {'h', 'i', '!', '?', '.'};
    on.feed(plain.data(), 2);
    T_ASSERT(!on.mode_known());
    on.feed(plain.data() + 2, 3);
    on.finish();
    T_ASSERT(!on.decompressing());
    T_ASSERT(out == plain);

    // payload shorter than the magic
    out.clear();
    PayloadRestorer shortp(true, [&](const uint8_t* p, size_t n) { out.insert(out.end(), p, p + n); });
    shortp.feed(plain.data(), 2);
    shortp.finish();
    T_ASSERT(out.size() == 2);

    // empty input: no frame at all, empty restore
    T_ASSERT(prepare_restore({}, true, 16, payload, restored, enc_sum, dec_sum));
    T_ASSERT(payload.empty());
    T_ASSERT(restored.empty());
    T_ASSERT(enc_sum == sha256_hex(nullptr, 0));
    return true;
}

// ------------------ TEST D : damaged compressed payloads ---------------------
static bool test_damaged() {
    std::vector<uint8_t> payload;
    const auto text = make_text(50000);
    PayloadPreparer prep(true, 3, [&](const uint8_t* p, size_t n) { payload.insert(payload.end(), p, p + n); });
    prep.feed(text.data(), text.size());
    prep.finish();

    // truncated frame
    bool threw = false;
    try {
        PayloadRestorer rest(true, [](const uint8_t*, size_t) {});
        rest.feed(payload.data(), payload.size() / 2);
        rest.finish();
    } catch (const DecodingError&) {
        threw = true;
    }
    T_ASSERT(threw);

    // flipped byte in the middle: zstd (content checksum) or the digest catches it
    std::vector<uint8_t> flipped = payload;
    flipped[flipped.size() / 2] ^= 0x5A;
    std::vector<uint8_t> out;
    threw = false;
    try {
        PayloadRestorer rest(true, [&](const uint8_t* p, size_t n) { out.insert(out.end(), p, p + n); });
        rest.feed(flipped.data(), flipped.size());
        verify_checksum(prep.checksum(), rest.finish());
    } catch (const DecodingError&) {
        threw = true;
    }
    T_ASSERT(threw || out == text);
    return true;
}

// ------------------ TEST E : chunking ----------------------------------------
static bool test_chunking() {
    const auto data = make_random(10000, 3);

    auto chunks = slice_payload(data, 4096);
    T_ASSERT(chunks.size() == 3);
    T_ASSERT(chunks[0].payload.size() == 4096 && chunks[2].payload.size() == 10000 - 2 * 4096);
    T_ASSERT(chunks[2].index == 2);
    T_ASSERT(slice_payload({}, 4096).empty());

    // streaming slicer emits the same sequence whatever the piece size
    std::vector<Chunk> streamed;
    ChunkSlicer slicer(4096, [&](Chunk c) { streamed.push_back(std::move(c)); });
    size_t piece = 1;
    for (size_t off = 0; off < data.size(); off += piece, piece = piece * 3 + 1) {
        slicer.feed(data.data() + off, std::min(piece, data.size() - off));
    }
    slicer.finish();
    T_ASSERT(slicer.chunks_emitted() == chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        T_ASSERT(streamed[i].index == i);
        T_ASSERT(streamed[i].payload == chunks[i].payload);
    }

    // exact multiple: no empty tail chunk
    std::vector<Chunk> exact;
    ChunkSlicer even(100, [&](Chunk c) { exact.push_back(std::move(c)); });
    even.feed(data.data(), 300);
    even.finish();
    T_ASSERT(exact.size() == 3);

    ChunkSlicer none(100, [&](Chunk) {});
    none.finish();
    T_ASSERT(none.chunks_emitted() == 0);
    return true;
}

int main() {
    bool ok = true;

    ok &= test_sha256();
    std::cout << "[A] sha256 : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_compressed();
    std::cout << "[B] compressed payload : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_raw_and_magic();
    std::cout << "[C] raw payload / magic : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_damaged();
    std::cout << "[D] damaged payload : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_chunking();
    std::cout << "[E] chunking : " << (ok ? "OK" : "FAIL") << "\n";

    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
