#include "messaging/Replies.hh"

#include <algorithm>
#include <iterator>

namespace Clue {
namespace Messaging {

const ByteSpan REPLY_SUCCESS = "OK"_BS;
const ByteSpan REPLY_FAILURE = "ERR"_BS;

bool isSuccessful(const ByteSpan status)
{
    return status.size() >= REPLY_SUCCESS.size() &&
        std::equal(
            REPLY_SUCCESS.begin(), REPLY_SUCCESS.end(), status.begin());
}

Blob makeFailureStatus(const ByteSpan suffix)
{
    auto ret = Blob(REPLY_FAILURE.begin(), REPLY_FAILURE.end());
    ret.insert(ret.end(), suffix.begin(), suffix.end());
    return ret;
}

}
}
