// include/verhoeff/verhoeff.hpp - Umbrella header that exposes the verhoeff components.

#pragma once

// Umbrella header for verhoeff.
// Users should generally include only this file.

#include <verhoeff/checksum.hpp>
#include <verhoeff/core/detail/lut.hpp>
#include <verhoeff/core/engine.hpp>
#include <verhoeff/core/error.hpp>
#include <verhoeff/identifier.hpp>
#include <verhoeff/io/format.hpp>
#include <verhoeff/io/parse.hpp>
#include <verhoeff/util/debug.hpp>
