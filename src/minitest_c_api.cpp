// Mini-tests: C ABI (handles, return codes, last error, callbacks)

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "pixvault_c.h"

#define T_ASSERT(expr) do{ if(!(expr)){ \
    std::cerr << "[FAIL] " << __FUNCTION__ << ":" << __LINE__ << " -> " #expr "\n"; return false; } }while(0)

namespace fs = std::filesystem;

static std::string tmp(const std::string& name) {
    return (fs::temp_directory_path() / ("pixvault_capi_" + std::to_string(::getpid()) + "_" + name)).string();
}

static std::string take_error() {
    char* msg = pixvault_last_error();
    if (!msg) return std::string();
    std::string out(msg);
    pixvault_free_string(msg);
    return out;
}

struct CallbackCounter {
    uint64_t calls = 0;
    uint64_t last_frames = 0;
    std::string last_message;
};

static void on_progress(uint64_t, uint64_t frames, const char* message, void* user_data) {
    auto* counter = static_cast<CallbackCounter*>(user_data);
    ++counter->calls;
    counter->last_frames = frames;
    counter->last_message = message ? message : "";
}

struct BusySetter {
    pixvault_encode_handle* handle = nullptr;
    uint64_t calls = 0;
    int style_rc = PIXVAULT_SUCCESS;
    int compression_rc = PIXVAULT_SUCCESS;
};

// tries to change the handle's settings from inside its own run
static void on_progress_set(uint64_t, uint64_t, const char*, void* user_data) {
    auto* setter = static_cast<BusySetter*>(user_data);
    if (setter->calls++ > 0) return;
    setter->style_rc = pixvault_encode_set_style(setter->handle, "sweep");
    setter->compression_rc = pixvault_encode_set_compression(setter->handle, 0, 3);
}

// ------------------ TEST A : handles and validation --------------------------
static bool test_handles() {
    T_ASSERT(pixvault_init() == PIXVAULT_SUCCESS);
    T_ASSERT(std::strstr(pixvault_version(), "pixvault") != nullptr);

    pixvault_encode_handle* bad = pixvault_encode_create(100, 100, 30, 4096);
    T_ASSERT(bad == nullptr);
    T_ASSERT(take_error().find("256x256") != std::string::npos);

    T_ASSERT(pixvault_decode_create(1920, 1080, 0, 10, 1) == nullptr);
    T_ASSERT(!take_error().empty());

    pixvault_encode_handle* enc = pixvault_encode_create(256, 256, 30, 256);
    T_ASSERT(enc != nullptr);
    T_ASSERT(pixvault_last_error() == nullptr);

    T_ASSERT(pixvault_encode_set_style(enc, "bogus") == PIXVAULT_INVALID_INPUT);
    T_ASSERT(pixvault_encode_set_style(enc, nullptr) == PIXVAULT_INVALID_INPUT);
    T_ASSERT(pixvault_encode_set_style(enc, "nested") == PIXVAULT_SUCCESS);
    T_ASSERT(pixvault_encode_set_compression(enc, 1, 0) == PIXVAULT_INVALID_INPUT);
    T_ASSERT(pixvault_encode_set_compression(enc, 1, 5) == PIXVAULT_SUCCESS);

    T_ASSERT(pixvault_encode_set_style(nullptr, "rings") == PIXVAULT_INVALID_HANDLE);
    T_ASSERT(pixvault_encode_file(nullptr, "a", "b", nullptr, nullptr, nullptr) == PIXVAULT_INVALID_HANDLE);
    T_ASSERT(pixvault_decode_file(nullptr, "a", "b", nullptr, nullptr, nullptr) == PIXVAULT_INVALID_HANDLE);
    T_ASSERT(pixvault_encode_file(enc, nullptr, "b", nullptr, nullptr, nullptr) == PIXVAULT_INVALID_INPUT);

    pixvault_encode_free(enc);
    pixvault_encode_free(nullptr);
    pixvault_decode_free(nullptr);
    return true;
}

// ------------------ TEST B : round trip through the ABI ----------------------
static bool test_round_trip() {
    const std::string input = tmp("in.txt"), video = tmp("v.mp4"), output = tmp("out.txt");
    std::string text;
    for (int i = 0; i < 40; ++i) text += "line " + std::to_string(i) + " of a small text file\n";
    { std::ofstream(input, std::ios::binary) << text; }

    pixvault_encode_handle* enc = pixvault_encode_create(256, 256, 24, 256);
    T_ASSERT(enc != nullptr);
    CallbackCounter enc_progress;
    pixvault_encode_info info;
    int rc = pixvault_encode_file(enc, input.c_str(), video.c_str(), &info, on_progress, &enc_progress);
    pixvault_encode_free(enc);
    T_ASSERT(rc == PIXVAULT_SUCCESS);
    T_ASSERT(info.original_size == text.size());
    T_ASSERT(info.compressed == 1);
    T_ASSERT(info.encoded_size < text.size());   // repetitive text shrinks
    T_ASSERT(info.frame_count == (info.encoded_size + 255) / 256);
    T_ASSERT(std::strlen(info.checksum) == 64);
    T_ASSERT(enc_progress.calls > 0 && enc_progress.last_message == "Encoding complete");

    pixvault_decode_handle* dec = pixvault_decode_create(256, 256, info.effective_chunk_size, info.encoded_size, 1);
    T_ASSERT(dec != nullptr);
    CallbackCounter dec_progress;
    rc = pixvault_decode_file(dec, video.c_str(), output.c_str(), info.checksum, on_progress, &dec_progress);
    T_ASSERT(rc == PIXVAULT_SUCCESS);
    T_ASSERT(dec_progress.last_frames == info.frame_count);

    std::ifstream in(output, std::ios::binary);
    std::string restored((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    T_ASSERT(restored == text);

    const std::string wrong(64, 'f');
    rc = pixvault_decode_file(dec, video.c_str(), tmp("wrong.txt").c_str(), wrong.c_str(), nullptr, nullptr);
    T_ASSERT(rc == PIXVAULT_INTEGRITY_MISMATCH);
    T_ASSERT(take_error().find("mismatch") != std::string::npos);
    T_ASSERT(!fs::exists(tmp("wrong.txt")));

    rc = pixvault_decode_file(dec, tmp("nope.mp4").c_str(), tmp("nope.txt").c_str(), nullptr, nullptr, nullptr);
    T_ASSERT(rc == PIXVAULT_INVALID_INPUT);

    rc = pixvault_decode_file(dec, video.c_str(), tmp("short.txt").c_str(), "abc", nullptr, nullptr);
    T_ASSERT(rc == PIXVAULT_INVALID_INPUT);
    pixvault_decode_free(dec);

    std::error_code ec;
    for (const char* name : {"in.txt", "v.mp4", "out.txt"}) fs::remove(tmp(name), ec);
    return true;
}

// ------------------ TEST C : settings locked during a run --------------------
static bool test_busy_settings() {
    const std::string input = tmp("busy.bin"), video = tmp("busy.mp4");
    { std::ofstream(input, std::ios::binary) << std::string(700, 'x'); }

    pixvault_encode_handle* enc = pixvault_encode_create(256, 256, 24, 256);
    T_ASSERT(enc != nullptr);
    BusySetter setter;
    setter.handle = enc;
    pixvault_encode_info info;
    int rc = pixvault_encode_file(enc, input.c_str(), video.c_str(), &info, on_progress_set, &setter);
    T_ASSERT(rc == PIXVAULT_SUCCESS);
    T_ASSERT(setter.calls > 0);
    T_ASSERT(setter.style_rc == PIXVAULT_OPERATION_IN_PROGRESS);
    T_ASSERT(setter.compression_rc == PIXVAULT_OPERATION_IN_PROGRESS);
    // the run kept the settings it started with
    T_ASSERT(info.compressed == 1);

    T_ASSERT(pixvault_encode_set_style(enc, "sweep") == PIXVAULT_SUCCESS);
    T_ASSERT(pixvault_encode_set_compression(enc, 0, 3) == PIXVAULT_SUCCESS);
    pixvault_encode_free(enc);

    std::error_code ec;
    for (const char* name : {"busy.bin", "busy.mp4"}) fs::remove(tmp(name), ec);
    return true;
}

int main() {
    bool ok = true;

    ok &= test_handles();
    std::cout << "[A] handles / validation : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_round_trip();
    std::cout << "[B] round trip : " << (ok ? "OK" : "FAIL") << "\n";

    ok &= test_busy_settings();
    std::cout << "[C] settings locked during a run : " << (ok ? "OK" : "FAIL") << "\n";

    std::cout << (ok ? "ALL TESTS PASSED\n" : "SOME TESTS FAILED\n");
    return ok ? 0 : 1;
}
