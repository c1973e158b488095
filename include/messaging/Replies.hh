/** \file
 *
 * \brief Definition of the status codes of replies
 */

#ifndef MESSAGING_REPLIES_HH_
#define MESSAGING_REPLIES_HH_

#include "Blob.hh"

namespace Clue {
namespace Messaging {

/** \brief Status code of a successful reply
 *
 * The status consists of the ASCII characters OK.
 */
extern const ByteSpan REPLY_SUCCESS;

/** \brief Status code of a failed reply
 *
 * The status consists of the ASCII characters ERR. A failed status may be
 * followed by a suffix describing the failure, for example ERR:UNK.
 */
extern const ByteSpan REPLY_FAILURE;

/** \brief Determine if a status code is successful
 *
 * \return true if \p status begins with REPLY_SUCCESS, false otherwise
 */
bool isSuccessful(ByteSpan status);

/** \brief Make failed status code with a suffix
 *
 * \param suffix the suffix appended to REPLY_FAILURE
 *
 * \return REPLY_FAILURE followed by \p suffix
 */
Blob makeFailureStatus(ByteSpan suffix);

}
}

#endif // MESSAGING_REPLIES_HH_
