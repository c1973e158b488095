#ifndef MOCKSERIALIZATIONPOLICY_HH_
#define MOCKSERIALIZATIONPOLICY_HH_

#include "Blob.hh"

#include <boost/lexical_cast.hpp>

#include <string>

namespace Clue {
namespace Messaging {

/** \brief Serialization policy converting values with boost::lexical_cast
 *
 * Used to test message handlers independently of the JSON representation of
 * the parameters.
 */
class MockSerializationPolicy {
public:
    template<typename T> std::string serialize(const T& t);
    template<typename T> T deserialize(ByteSpan bytes);
};

template<typename T>
std::string MockSerializationPolicy::serialize(const T& t)
{
    return boost::lexical_cast<std::string>(t);
}

template<typename T>
T MockSerializationPolicy::deserialize(const ByteSpan bytes)
{
    return boost::lexical_cast<T>(blobToString(bytes));
}

}
}

#endif // MOCKSERIALIZATIONPOLICY_HH_
