/** \file
 *
 * \brief Definition of Clue::BlobMap
 */

#ifndef BLOBMAP_HH_
#define BLOBMAP_HH_

#include "Blob.hh"

#include <map>

namespace Clue {

/** \brief Transparent comparator ordering byte ranges by their contents
 */
struct BytewiseCompare {
    /// \brief Allow heterogeneous lookup
    using is_transparent = void;

    /** \brief Compare \p lhs and \p rhs byte by byte
     */
    template<typename Container1, typename Container2>
    bool operator()(const Container1& lhs, const Container2& rhs) const
    {
        return asBytes(lhs) < asBytes(rhs);
    }
};

/** \brief Map keyed by blobs
 *
 * Lookups can be done with any contiguous byte range (a ByteSpan received
 * from a message frame, for instance) without copying the key.
 */
template<typename T>
using BlobMap = std::map<Blob, T, BytewiseCompare>;

}

#endif // BLOBMAP_HH_
