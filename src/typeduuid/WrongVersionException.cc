#include "typeduuid/WrongVersionException.hh"

#include <string>

namespace TypedUuid {

WrongVersionException::WrongVersionException(const int expected, const int actual) :
    std::invalid_argument {
        "Wrong UUID version: expected " + std::to_string(expected) +
        ", got " + std::to_string(actual)},
    expected {expected},
    actual {actual}
{
}

}
