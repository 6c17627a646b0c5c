#pragma once
/**
 * @file api.h
 * @brief C API for ComputeBridge (FFI boundary, revision 2)
 *
 * The C API drives one process-wide bridge, created on first use. Its
 * configuration is read from the XML file named by the CBRIDGE_CONFIG
 * environment variable when set, defaults otherwise.
 *
 * Conventions:
 * - Handles are positive; -1 signals failure.
 * - Functions returning int status return 1 on success and 0 on failure.
 * - On failure *error receives a malloc'ed message that the caller releases
 *   with cbridge_free_error(). On success *error is left untouched, so
 *   callers initialize it to NULL. error itself may be NULL.
 * - cbridge_shutdown() must not race with any other call.
 */

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Open the default device (idempotent)
 */
void cbridge_init(char** error);

/**
 * @brief Compile kernel source and select the named entry point
 * @return Function handle, or -1 on failure
 */
int cbridge_new_function(const char* source, const char* name, char** error);

/**
 * @brief Entry point name of a function
 * @return Name valid until the next call on the same thread, or NULL if the
 *         handle is unknown
 */
const char* cbridge_function_name(int function_id);

/**
 * @brief Run a function over a width x height x depth grid and wait for it
 *
 * buffer_ids[i] is bound to kernel argument i.
 * @return 1 on success, 0 on failure
 */
int cbridge_run_function(int function_id, int width, int height, int depth,
                         const int* buffer_ids, int num_buffer_ids, char** error);

/**
 * @brief Allocate size bytes of zero-initialized memory shared with the device
 * @return Buffer handle, or -1 on failure
 */
int cbridge_new_buffer(int size, char** error);

/**
 * @brief Host pointer to a buffer, stable until the buffer is released
 * @return Pointer, or NULL on failure
 */
void* cbridge_retrieve_buffer(int buffer_id, char** error);

/**
 * @return 1 on success, 0 on failure
 */
int cbridge_release_function(int function_id, char** error);

/**
 * @return 1 on success, 0 on failure
 */
int cbridge_release_buffer(int buffer_id, char** error);

/**
 * @brief Release an error message returned by any function above
 */
void cbridge_free_error(char* error);

/**
 * @brief Release every function and buffer and close the device
 *
 * Handles issued before shutdown are invalid afterwards.
 */
void cbridge_shutdown(void);

#ifdef __cplusplus
} // extern "C"
#endif
