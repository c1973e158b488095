/** \file
 *
 * \brief Definition of Clue::Messaging::SerializationFailureException class
 */

#ifndef MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
#define MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_

#include <exception>

namespace Clue {
namespace Messaging {

/** \brief Exception signaling that a value could not be serialized or
 * deserialized
 *
 * The exception is not fatal. A message handler receiving it while
 * deserializing the arguments of a command replies with failure.
 */
class SerializationFailureException : public std::exception {
public:
    const char* what() const noexcept override;
};

inline const char* SerializationFailureException::what() const noexcept
{
    return "Serialization failure";
}

}
}

#endif // MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
