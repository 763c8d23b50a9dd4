/** \file
 *
 * \brief Definition of TypedUuid::ParseException class
 */

#ifndef PARSEEXCEPTION_HH_
#define PARSEEXCEPTION_HH_

#include <stdexcept>

namespace TypedUuid {

/** \brief Exception to indicate that input is not a well‐formed UUID
 *
 * Thrown when textual or binary input cannot be interpreted as a UUID. The
 * message is the one reported by the underlying UUID library, or a
 * description of the malformed binary input.
 */
class ParseException : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}

#endif // PARSEEXCEPTION_HH_
