#include "pixvault_c.h"
#include "pixvault.hpp"

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

struct pixvault_encode_handle {
    CodecConfig config;
    std::atomic<bool> busy{false};
};

struct pixvault_decode_handle {
    DecodeParams params;
    std::atomic<bool> busy{false};
};

namespace {

thread_local std::string g_last_error;
thread_local bool g_has_error = false;

void set_last_error(const std::string& message) {
    g_last_error = message;
    g_has_error = true;
}

void clear_last_error() {
    g_last_error.clear();
    g_has_error = false;
}

// Bridges a C callback into the ProgressSink interface
class CallbackSink : public ProgressSink {
public:
    CallbackSink(pixvault_progress_cb cb, void* user_data) : cb_(cb), user_data_(user_data) {}

    void notify(uint64_t bytes_processed, uint64_t frames_processed, const std::string& message) override {
        cb_(bytes_processed, frames_processed, message.c_str(), user_data_);
    }

private:
    pixvault_progress_cb cb_;
    void* user_data_;
};

int fail(const VaultError& e) {
    set_last_error(e.what());
    return static_cast<int>(e.code());
}

class BusyGuard {
public:
    explicit BusyGuard(std::atomic<bool>& busy) : busy_(busy) {
        bool expected = false;
        acquired_ = busy_.compare_exchange_strong(expected, true);
    }
    ~BusyGuard() {
        if (acquired_) busy_.store(false);
    }
    bool acquired() const { return acquired_; }

private:
    std::atomic<bool>& busy_;
    bool acquired_ = false;
};

} // namespace

extern "C" {

int pixvault_init(void) {
    try {
        return static_cast<int>(library_init());
    } catch (const VaultError& e) {
        return fail(e);
    }
}

const char* pixvault_version(void) {
    return library_version();
}

char* pixvault_last_error(void) {
    if (!g_has_error) return nullptr;
    char* copy = static_cast<char*>(std::malloc(g_last_error.size() + 1));
    if (!copy) return nullptr;
    std::memcpy(copy, g_last_error.c_str(), g_last_error.size() + 1);
    return copy;
}

void pixvault_free_string(char* s) {
    std::free(s);
}

pixvault_encode_handle* pixvault_encode_create(uint32_t width, uint32_t height, uint32_t fps, size_t chunk_size) {
    try {
        auto handle = std::make_unique<pixvault_encode_handle>();
        handle->config.width = static_cast<int>(width);
        handle->config.height = static_cast<int>(height);
        handle->config.fps = static_cast<int>(fps);
        handle->config.chunk_size = chunk_size;
        handle->config.validate();
        clear_last_error();
        return handle.release();
    } catch (const VaultError& e) {
        fail(e);
    } catch (const std::exception& e) {
        set_last_error(e.what());
    }
    return nullptr;
}

int pixvault_encode_set_compression(pixvault_encode_handle* handle, int enabled, int level) {
    if (!handle) return PIXVAULT_INVALID_HANDLE;
    BusyGuard busy(handle->busy);
    if (!busy.acquired()) {
        set_last_error("Encode handle is in use, settings cannot change during a run");
        return PIXVAULT_OPERATION_IN_PROGRESS;
    }
    CodecConfig updated = handle->config;
    updated.use_compression = enabled != 0;
    updated.compression_level = level;
    try {
        updated.validate();
    } catch (const VaultError& e) {
        return fail(e);
    }
    handle->config = updated;
    return PIXVAULT_SUCCESS;
}

int pixvault_encode_set_style(pixvault_encode_handle* handle, const char* style) {
    if (!handle) return PIXVAULT_INVALID_HANDLE;
    if (!style) {
        set_last_error("Pattern style is NULL");
        return PIXVAULT_INVALID_INPUT;
    }
    BusyGuard busy(handle->busy);
    if (!busy.acquired()) {
        set_last_error("Encode handle is in use, settings cannot change during a run");
        return PIXVAULT_OPERATION_IN_PROGRESS;
    }
    try {
        handle->config.pattern_style = parse_pattern_style(style);
    } catch (const VaultError& e) {
        return fail(e);
    }
    return PIXVAULT_SUCCESS;
}

int pixvault_encode_file(pixvault_encode_handle* handle, const char* input_path, const char* output_path,
                         pixvault_encode_info* info_out, pixvault_progress_cb progress, void* user_data) {
    if (!handle) return PIXVAULT_INVALID_HANDLE;
    if (!input_path || !output_path) {
        set_last_error("Input and output paths are required");
        return PIXVAULT_INVALID_INPUT;
    }
    BusyGuard busy(handle->busy);
    if (!busy.acquired()) {
        set_last_error("Encode handle is already in use");
        return PIXVAULT_OPERATION_IN_PROGRESS;
    }

    try {
        CallbackSink sink(progress, user_data);
        EncodeResult result = encode_file(input_path, output_path, handle->config, progress ? &sink : nullptr);
        if (info_out) {
            info_out->encoded_size = result.encoded_payload_size;
            info_out->effective_chunk_size = result.effective_chunk_size;
            info_out->original_size = result.original_size;
            info_out->frame_count = result.frame_count;
            info_out->compressed = result.compressed ? 1 : 0;
            std::memset(info_out->checksum, 0, sizeof(info_out->checksum));
            std::strncpy(info_out->checksum, result.checksum.c_str(), sizeof(info_out->checksum) - 1);
        }
        clear_last_error();
        return PIXVAULT_SUCCESS;
    } catch (const VaultError& e) {
        return fail(e);
    } catch (const std::exception& e) {
        set_last_error(e.what());
        return PIXVAULT_UNKNOWN;
    }
}

void pixvault_encode_free(pixvault_encode_handle* handle) {
    delete handle;
}

pixvault_decode_handle* pixvault_decode_create(uint32_t width, uint32_t height, size_t chunk_size,
                                               uint64_t encoded_size, int use_compression) {
    try {
        auto handle = std::make_unique<pixvault_decode_handle>();
        handle->params.width = static_cast<int>(width);
        handle->params.height = static_cast<int>(height);
        handle->params.chunk_size = chunk_size;
        handle->params.encoded_payload_size = encoded_size;
        handle->params.use_compression = use_compression != 0;
        handle->params.validate();
        clear_last_error();
        return handle.release();
    } catch (const VaultError& e) {
        fail(e);
    } catch (const std::exception& e) {
        set_last_error(e.what());
    }
    return nullptr;
}

int pixvault_decode_file(pixvault_decode_handle* handle, const char* input_path, const char* output_path,
                         const char* expected_checksum, pixvault_progress_cb progress, void* user_data) {
    if (!handle) return PIXVAULT_INVALID_HANDLE;
    if (!input_path || !output_path) {
        set_last_error("Input and output paths are required");
        return PIXVAULT_INVALID_INPUT;
    }
    BusyGuard busy(handle->busy);
    if (!busy.acquired()) {
        set_last_error("Decode handle is already in use");
        return PIXVAULT_OPERATION_IN_PROGRESS;
    }

    try {
        DecodeParams params = handle->params;
        if (expected_checksum) params.expected_checksum = expected_checksum;
        CallbackSink sink(progress, user_data);
        decode_file(input_path, output_path, params, progress ? &sink : nullptr);
        clear_last_error();
        return PIXVAULT_SUCCESS;
    } catch (const IntegrityError& e) {
        set_last_error(e.what());
        return PIXVAULT_INTEGRITY_MISMATCH;
    } catch (const VaultError& e) {
        return fail(e);
    } catch (const std::exception& e) {
        set_last_error(e.what());
        return PIXVAULT_UNKNOWN;
    }
}

void pixvault_decode_free(pixvault_decode_handle* handle) {
    delete handle;
}

} // extern "C"
