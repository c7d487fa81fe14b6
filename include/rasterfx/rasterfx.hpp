#ifndef RASTERFX_RASTERFX_HPP_
#define RASTERFX_RASTERFX_HPP_

#include <rasterfx/rasterfx_export.h>
#include <rasterfx/types.hpp>
#include <rasterfx/surface.hpp>
#include <rasterfx/codec.hpp>
#include <rasterfx/color.hpp>
#include <rasterfx/filters.hpp>
#include <rasterfx/engine.hpp>
#include <rasterfx/codecs/png.hpp>
#include <rasterfx/codecs/stb.hpp>

namespace rasterfx {

// All public API is included via the headers above.
// See:
//   - types.hpp:    rgba, error enums, decode/encode/filter results, decode_options
//   - surface.hpp:  surface interface, pixel_buffer
//   - codec.hpp:    decoder, codec_registry (detect, by_name), decode()
//   - color.hpp:    RGB <-> HSL, luma
//   - filters.hpp:  filter_kind, filter_options, kernels, apply()
//   - engine.hpp:   apply_filter()
//   - codecs/png.hpp: PNG decoder and the encode_png() output stage
//   - codecs/stb.hpp: JPEG, GIF, BMP and TGA decoders

} // namespace rasterfx

#endif // RASTERFX_RASTERFX_HPP_
