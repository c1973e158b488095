#include "messaging/Identity.hh"

#include "messaging/MessageUtility.hh"

#include <boost/algorithm/hex.hpp>

#include <iterator>
#include <ostream>

namespace Clue {
namespace Messaging {

Identity identityFromMessage(
    Message& message, const Message* routerIdentityFrame)
{
    auto user_id = UserId {};
    try {
        user_id = message.gets("User-Id");
    } catch (const SocketError&) {
        // no authentication, the property is absent
    }
    auto routing_id = RoutingId {};
    if (routerIdentityFrame) {
        const auto view = messageView(*routerIdentityFrame);
        routing_id.assign(view.begin(), view.end());
    }
    return { std::move(user_id), std::move(routing_id) };
}

std::ostream& operator<<(std::ostream& os, const Identity& identity)
{
    os << identity.userId << "/";
    const auto* first =
        reinterpret_cast<const unsigned char*>(identity.routingId.data());
    boost::algorithm::hex_lower(
        first, first + identity.routingId.size(),
        std::ostreambuf_iterator<char> {os});
    return os;
}

}
}
