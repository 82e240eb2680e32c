#ifndef GPUMON_SOURCE_COMPAT_NVML_DETECT_HPP
#define GPUMON_SOURCE_COMPAT_NVML_DETECT_HPP
/**
 * @file compat_nvml_detect.hpp
 * @brief NVML availability/version detection + missing-constant shims.
 *
 * Macros:
 *  - COMPAT_NVML_AVAILABLE         : 1 if NVML is available for this build, else 0
 *  - COMPAT_NVML_HEADER_AVAILABLE  : 1 if <nvml.h> is includable, else 0
 *  - COMPAT_NVML_API_VERSION       : NVML_API_VERSION if provided by the header, else 0
 *
 * Notes:
 *  - CMake forces availability from its NVML lookup:
 *      -DCOMPAT_NVML_AVAILABLE=1   or   -DCOMPAT_NVML_AVAILABLE=0
 *  - This header does not link or initialize NVML. Without NVML the NVML source
 *    compiles to a stub that always reports itself unavailable.
 */

/* ---------------------- Availability Detection ---------------------------- */
#ifndef COMPAT_NVML_AVAILABLE
#if defined(__has_include)
#if __has_include(<nvml.h>)
#define COMPAT_NVML_HEADER_AVAILABLE 1
#else
#define COMPAT_NVML_HEADER_AVAILABLE 0
#endif
#else
#define COMPAT_NVML_HEADER_AVAILABLE 0
#endif

#if COMPAT_NVML_HEADER_AVAILABLE
#define COMPAT_NVML_AVAILABLE 1
#else
#define COMPAT_NVML_AVAILABLE 0
#endif
#else
#ifndef COMPAT_NVML_HEADER_AVAILABLE
#define COMPAT_NVML_HEADER_AVAILABLE COMPAT_NVML_AVAILABLE
#endif
#endif

/* ---------------------- Header Import + Version -------------------------- */
#if COMPAT_NVML_AVAILABLE
#include <nvml.h>
#ifdef NVML_API_VERSION
#define COMPAT_NVML_API_VERSION NVML_API_VERSION
#else
#define COMPAT_NVML_API_VERSION 0
#endif
#else
#define COMPAT_NVML_API_VERSION 0
#endif

/* --------------------- Compatibility Shims (Macros) ----------------------- */
#if COMPAT_NVML_AVAILABLE

// Older headers miss the buffer-size constants used for name/UUID queries.
#ifndef NVML_DEVICE_NAME_BUFFER_SIZE
#define NVML_DEVICE_NAME_BUFFER_SIZE 96
#endif
#ifndef NVML_DEVICE_NAME_V2_BUFFER_SIZE
#define NVML_DEVICE_NAME_V2_BUFFER_SIZE NVML_DEVICE_NAME_BUFFER_SIZE
#endif
#ifndef NVML_DEVICE_UUID_V2_BUFFER_SIZE
#define NVML_DEVICE_UUID_V2_BUFFER_SIZE 96
#endif

#endif // COMPAT_NVML_AVAILABLE

#endif // GPUMON_SOURCE_COMPAT_NVML_DETECT_HPP
