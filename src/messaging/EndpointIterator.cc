#include "messaging/EndpointIterator.hh"

#include <boost/lexical_cast.hpp>

#include <stdexcept>
#include <string_view>
#include <utility>

namespace Clue {
namespace Messaging {

namespace {

constexpr auto TCP_PREFIX = std::string_view {"tcp://"};

std::string parseAddress(const std::string& endpoint)
{
    const auto colon = endpoint.rfind(':');
    if (endpoint.compare(0, TCP_PREFIX.size(), TCP_PREFIX) != 0 ||
        colon == std::string::npos || colon <= TCP_PREFIX.size()) {
        throw std::invalid_argument {"Invalid endpoint: " + endpoint};
    }
    return endpoint.substr(TCP_PREFIX.size(), colon - TCP_PREFIX.size());
}

int parsePort(const std::string& endpoint)
{
    const auto port_string = endpoint.substr(endpoint.rfind(':') + 1);
    try {
        const auto port = boost::lexical_cast<int>(port_string);
        if (port >= 0) {
            return port;
        }
    } catch (const boost::bad_lexical_cast&) {
        // fall through to the error below
    }
    throw std::invalid_argument {"Invalid port in endpoint: " + endpoint};
}

}

EndpointIterator::EndpointIterator(const std::string& endpoint) :
    address {parseAddress(endpoint)},
    port {parsePort(endpoint)}
{
}

EndpointIterator::EndpointIterator(std::string address, const int port) :
    address {std::move(address)},
    port {port}
{
}

int EndpointIterator::getPort() const
{
    return port;
}

EndpointIterator::reference EndpointIterator::dereference() const
{
    return std::string {TCP_PREFIX} + address + ':' + std::to_string(port);
}

bool EndpointIterator::equal(const EndpointIterator& other) const
{
    return port == other.port && address == other.address;
}

void EndpointIterator::increment()
{
    ++port;
}

void EndpointIterator::decrement()
{
    --port;
}

void EndpointIterator::advance(const difference_type n)
{
    port += n;
}

EndpointIterator::difference_type EndpointIterator::distance_to(
    const EndpointIterator& other) const
{
    return other.port - port;
}

}
}
