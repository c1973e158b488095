/** \file
 *
 * \brief Definition of Clue::Messaging::EndpointIterator
 */

#ifndef MESSAGING_ENDPOINTITERATOR_HH_
#define MESSAGING_ENDPOINTITERATOR_HH_

#include <boost/iterator/iterator_facade.hpp>

#include <string>

namespace Clue {
namespace Messaging {

/** \brief Generator of consecutive ZeroMQ TCP endpoints
 *
 * The server binds its sockets to consecutive ports of the same interface.
 * EndpointIterator generates the endpoints: dereferencing yields the
 * endpoint of the current port, and advancing the iterator advances the
 * port.
 *
 * \code{.cc}
 * auto iter = EndpointIterator {"*", 5555};
 * // *iter == "tcp://\*:5555"
 * ++iter;
 * // *iter == "tcp://\*:5556"
 * \endcode
 *
 * The distance between two iterators is the difference of their ports.
 */
class EndpointIterator : public boost::iterator_facade<
    EndpointIterator, std::string, boost::random_access_traversal_tag,
    std::string, int>
{
public:

    /** \brief Create endpoint iterator from endpoint
     *
     * \param endpoint TCP endpoint of the form tcp://&lt;address&gt;:&lt;port&gt;
     *
     * \throw std::invalid_argument if \p endpoint is not of that form
     */
    explicit EndpointIterator(const std::string& endpoint);

    /** \brief Create endpoint iterator
     *
     * \param address the address or interface name
     * \param port the first port
     */
    EndpointIterator(std::string address, int port);

    /** \brief Get the current port
     */
    int getPort() const;

private:

    reference dereference() const;
    bool equal(const EndpointIterator& other) const;
    void increment();
    void decrement();
    void advance(difference_type n);
    difference_type distance_to(const EndpointIterator& other) const;

    std::string address;
    int port;

    friend class boost::iterator_core_access;
};

}
}

#endif // MESSAGING_ENDPOINTITERATOR_HH_
