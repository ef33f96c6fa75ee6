#ifndef ICODEC_ICODEC_HPP_
#define ICODEC_ICODEC_HPP_

#include <icodec/icodec_export.h>
#include <icodec/types.hpp>
#include <icodec/byte_source.hpp>
#include <icodec/surface.hpp>
#include <icodec/icon_directory.hpp>
#include <icodec/icon_file.hpp>
#include <icodec/codec.hpp>
#include <icodec/codecs/ico.hpp>
#include <icodec/codecs/png.hpp>

namespace icodec {

// All public API is included via the headers above.
// See:
//   - types.hpp:          pixel_format, resource_type, decode_error, decode_result, decode_options
//   - byte_source.hpp:    forward-only byte sources (memory, istream, file)
//   - icon_directory.hpp: icon_directory, directory_entry, decoded_image, DIB structures
//   - icon_file.hpp:      icon_file::read, DIB layout helpers
//   - surface.hpp:        surface interface, memory_surface
//   - codec.hpp:          decoder, codec_registry, decode()
//   - codecs/*.hpp:       ICO atlas and PNG codecs

} // namespace icodec

#endif // ICODEC_ICODEC_HPP_
