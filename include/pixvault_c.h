#ifndef PIXVAULT_C_H
#define PIXVAULT_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Return codes of every int-returning call */
enum {
    PIXVAULT_SUCCESS = 0,
    PIXVAULT_INVALID_INPUT = 1,
    PIXVAULT_IO_ERROR = 2,
    PIXVAULT_ENCODING_ERROR = 3,
    PIXVAULT_DECODING_ERROR = 4,
    PIXVAULT_CONFIG_ERROR = 5,
    PIXVAULT_OPERATION_IN_PROGRESS = 6,
    PIXVAULT_INVALID_HANDLE = 7,
    PIXVAULT_INTERRUPTED = 8,
    PIXVAULT_INTEGRITY_MISMATCH = 9,
    PIXVAULT_UNKNOWN = 255
};

typedef struct pixvault_encode_handle pixvault_encode_handle;
typedef struct pixvault_decode_handle pixvault_decode_handle;

/* Called on the job's thread; message is only valid during the call */
typedef void (*pixvault_progress_cb)(uint64_t bytes_processed, uint64_t frames_processed,
                                     const char* message, void* user_data);

typedef struct {
    uint64_t encoded_size;          /* needed to decode */
    size_t effective_chunk_size;    /* needed to decode */
    uint64_t original_size;
    uint64_t frame_count;
    int compressed;
    char checksum[65];              /* SHA-256 hex of the original file */
} pixvault_encode_info;

int pixvault_init(void);
const char* pixvault_version(void);

/* Message of the last failed call on this thread, or NULL. Free with
   pixvault_free_string. */
char* pixvault_last_error(void);
void pixvault_free_string(char* s);

/* NULL on invalid parameters (see pixvault_last_error) */
pixvault_encode_handle* pixvault_encode_create(uint32_t width, uint32_t height, uint32_t fps, size_t chunk_size);
/* Settings are fixed while a run is active: PIXVAULT_OPERATION_IN_PROGRESS then */
int pixvault_encode_set_compression(pixvault_encode_handle* handle, int enabled, int level);
int pixvault_encode_set_style(pixvault_encode_handle* handle, const char* style);
int pixvault_encode_file(pixvault_encode_handle* handle, const char* input_path, const char* output_path,
                         pixvault_encode_info* info_out, pixvault_progress_cb progress, void* user_data);
void pixvault_encode_free(pixvault_encode_handle* handle);

pixvault_decode_handle* pixvault_decode_create(uint32_t width, uint32_t height, size_t chunk_size,
                                               uint64_t encoded_size, int use_compression);
/* expected_checksum may be NULL */
int pixvault_decode_file(pixvault_decode_handle* handle, const char* input_path, const char* output_path,
                         const char* expected_checksum, pixvault_progress_cb progress, void* user_data);
void pixvault_decode_free(pixvault_decode_handle* handle);

#ifdef __cplusplus
}
#endif

#endif /* PIXVAULT_C_H */
