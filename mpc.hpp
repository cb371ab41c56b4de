#pragma once

/*
 * mpcodec: MessagePack encoder and decoder over a small dynamic value model.
 *
 * Usage:
 *  1) Build a `mpc::Value` tree (nil, bool, integer, float, string, binary, array, map, extension);
 *  2) `mpc::encode( value )` returns a fresh byte buffer, or an `EncodeError`;
 *  3) `mpc::decode( bytes, cursor )` returns the value at `cursor` and the number of bytes it occupies, or a `DecodeError`.
 *
 * `mpc::Writer` is the lower-level, chained interface for writing values one marker at a time.
 */

#include "mpc_config.hpp"
#include "mpc_types.hpp"
#include "mpc_error.hpp"
#include "mpc_log.hpp"
#include "mpc_marker.hpp"
#include "mpc_stream.hpp"
#include "mpc_value.hpp"
#include "mpc_utf8.hpp"
#include "mpc_encoder.hpp"
#include "mpc_decoder.hpp"
