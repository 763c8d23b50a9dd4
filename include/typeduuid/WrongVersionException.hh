/** \file
 *
 * \brief Definition of TypedUuid::WrongVersionException class
 */

#ifndef WRONGVERSIONEXCEPTION_HH_
#define WRONGVERSIONEXCEPTION_HH_

#include <stdexcept>

namespace TypedUuid {

/** \brief Exception to indicate that a UUID has unexpected version
 *
 * Thrown by Id::fromUuid() when the version of the UUID being wrapped is not
 * the one of the version marker of the identifier.
 */
class WrongVersionException : public std::invalid_argument {
public:

    /** \brief Create new exception
     *
     * \param expected the version required by the version marker
     * \param actual the version of the offending UUID
     */
    WrongVersionException(int expected, int actual);

    /** \brief Return the version required by the version marker
     */
    int getExpected() const noexcept { return expected; }

    /** \brief Return the version of the offending UUID
     */
    int getActual() const noexcept { return actual; }

private:
    int expected;
    int actual;
};

}

#endif // WRONGVERSIONEXCEPTION_HH_
