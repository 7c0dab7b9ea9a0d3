#pragma once

#if defined(_WIN32)
    #if defined(POLYDOC_EXPORT)
        #define POLYDOC_C_API __declspec(dllexport)
    #else
        #define POLYDOC_C_API __declspec(dllimport)
    #endif
#else
    #define POLYDOC_C_API __attribute__((visibility("default")))
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
//  Error Handling
// =============================================================================

// Thread-local error storage
POLYDOC_C_API const char* polydoc_get_last_error();
POLYDOC_C_API const char* polydoc_get_version();

// Strings returned through char** or char* are owned by the caller.
POLYDOC_C_API void polydoc_free_string(char* str);

// =============================================================================
//  Detection
// =============================================================================

POLYDOC_C_API bool polydoc_detect_format_file(const char* path, char** out_format);
POLYDOC_C_API bool polydoc_detect_format_buffer(const char* data, size_t len, const char* filename_hint,
                                                char** out_format);

// =============================================================================
//  Conversion
// =============================================================================

typedef struct HConversionReport {
    char source_format[64];
    char target_format[64];
    size_t transforms_applied;
    double total_ms;
} HConversionReport;

/*
 * source_format may be NULL for detection. transforms may be NULL, a
 * comma-separated list of names ("remove-images,add-heading-ids") or a JSON
 * array whose items are names or {"name": ..., "params": {...}} objects.
 * out_report may be NULL.
 */
POLYDOC_C_API bool polydoc_convert_file(const char* input_path, const char* output_path,
                                        const char* source_format, const char* target_format,
                                        const char* transforms, HConversionReport* out_report);

POLYDOC_C_API bool polydoc_convert_buffer(const char* data, size_t len, const char* filename_hint,
                                          const char* source_format, const char* target_format,
                                          const char* transforms, char** out_text, size_t* out_len);

// =============================================================================
//  Registries
// =============================================================================

// JSON array describing every registered format.
POLYDOC_C_API char* polydoc_list_formats();
// JSON array describing every registered transform.
POLYDOC_C_API char* polydoc_list_transforms();

// paths: colon-separated files or directories; NULL uses POLYDOC_PLUGIN_PATH.
POLYDOC_C_API bool polydoc_load_plugins(const char* paths, size_t* out_loaded, size_t* out_failed);

#ifdef __cplusplus
}
#endif
