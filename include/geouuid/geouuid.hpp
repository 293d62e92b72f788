/**
 * @file geouuid.hpp
 * @brief GeoTemporal UUID high-level API.
 *
 * Includes every public header. Typical use:
 *
 * @code
 * geouuid::Generator gen;
 * geouuid::Identifier id;
 * if (gen.generate(48.8584, 2.2945, id) == geouuid::Error::Ok) {
 *     geouuid::Decoded d = geouuid::decode(id);
 * }
 * @endcode
 */

#ifndef GEOUUID_HPP
#define GEOUUID_HPP

#include "binding.hpp"
#include "bitbuffer.hpp"
#include "bitreader.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"
#include "generator.hpp"
#include "identifier.hpp"
#include "layout.hpp"
#include "quantize.hpp"
#include "timestamp.hpp"

namespace geouuid {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace geouuid

#endif // GEOUUID_HPP
