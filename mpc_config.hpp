#pragma once

/*
 * Compile-time configuration. Every macro can be overridden with `-D` before any mpcodec header is included.
 */

/*
 * Maximum number of nested arrays/maps the decoder descends into before failing with `DecodeError::DepthExceeded`.
 */
#ifndef MPC_MAX_DEPTH
#define MPC_MAX_DEPTH 512
#endif

/*
 * Initial level of the library logger, as a `spdlog::level::level_enum` value. Defaults to `warn`.
 */
#ifndef MPC_LOG_LEVEL
#define MPC_LOG_LEVEL 3
#endif
