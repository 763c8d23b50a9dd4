/** \file
 *
 * \brief Definition of JSON serialization policies
 *
 * The policies are based on the JSON library by nlohmann
 * (https://github.com/nlohmann/json). Typed identifiers and UUIDs become
 * serializable with them by including UuidJsonSerializer.hh.
 */

#ifndef MESSAGING_JSONSERIALIZER_HH_
#define MESSAGING_JSONSERIALIZER_HH_

#include "messaging/SerializationFailureException.hh"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace TypedUuid {
namespace Messaging {

/** \brief Serialization policy that uses JSON text
 *
 * Objects are converted to JSON and dumped as string. For deserialization the
 * input is parsed as JSON and converted to the desired type.
 */
struct JsonSerializer {

    /** \brief Serialize object to string
     *
     * \param t the object to serialize
     *
     * \return string dump of the JSON object resulting from converting \p t
     */
    template<typename T> static std::string serialize(T&& t)
    {
        return nlohmann::json(std::forward<T>(t)).dump();
    }

    /** \brief Deserialize string to object
     *
     * \param s contiguous sequence of one byte characters
     *
     * \return object retrieved by parsing \p s into JSON and then converting
     * it to an object of type \c T
     *
     * \throw SerializationFailureException if \p s is not valid JSON or cannot
     * be converted to \c T
     */
    template<typename T, typename String>
    static T deserialize(const String& s)
    {
        static_assert(sizeof(*std::data(s)) == 1);
        try {
            const auto sv = std::string_view(
                reinterpret_cast<const char*>(std::data(s)), std::size(s));
            return nlohmann::json::parse(sv).template get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw SerializationFailureException {e.what()};
        }
    }
};

/** \brief Serialization policy that uses CBOR
 *
 * Like JsonSerializer, but the JSON objects are encoded in the binary CBOR
 * format (RFC 8949).
 */
struct CborSerializer {

    /** \brief Serialize object to bytes
     *
     * \param t the object to serialize
     *
     * \return CBOR encoding of the JSON object resulting from converting \p t
     */
    template<typename T> static std::vector<std::uint8_t> serialize(T&& t)
    {
        return nlohmann::json::to_cbor(nlohmann::json(std::forward<T>(t)));
    }

    /** \brief Deserialize bytes to object
     *
     * \param bytes contiguous sequence of bytes
     *
     * \return object retrieved by decoding \p bytes and then converting it to
     * an object of type \c T
     *
     * \throw SerializationFailureException if \p bytes is not valid CBOR or
     * cannot be converted to \c T
     */
    template<typename T, typename Bytes>
    static T deserialize(const Bytes& bytes)
    {
        static_assert(sizeof(*std::data(bytes)) == 1);
        try {
            const auto* first =
                reinterpret_cast<const std::uint8_t*>(std::data(bytes));
            return nlohmann::json::from_cbor(first, first + std::size(bytes))
                .template get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw SerializationFailureException {e.what()};
        }
    }
};

}
}

#endif // MESSAGING_JSONSERIALIZER_HH_
