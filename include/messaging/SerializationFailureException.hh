/** \file
 *
 * \brief Definition of TypedUuid::Messaging::SerializationFailureException class
 */

#ifndef MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
#define MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_

#include <stdexcept>

namespace TypedUuid {
namespace Messaging {

/** \brief Exception to indicate error in serialization or deserialization
 *
 * Thrown by the serializers and the JSON converters when the input cannot be
 * converted to the requested type, for instance when it is not a valid UUID.
 */
class SerializationFailureException : public std::runtime_error {
public:

    using std::runtime_error::runtime_error;
};

}
}

#endif // MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
