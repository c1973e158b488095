/** \file
 *
 * \brief Definition of Clue::Blob and Clue::ByteSpan
 */

#ifndef BLOB_HH_
#define BLOB_HH_

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace Clue {

/** \brief Owning sequence of raw bytes
 *
 * Message frames, routing identities and other binary data are stored as
 * blobs.
 */
class Blob : public std::vector<std::byte> {
public:
    using std::vector<std::byte>::vector;
};

/** \brief Read‐only view to raw bytes
 *
 * Unlike a plain <tt>std::span<const std::byte></tt>, byte spans compare by
 * their contents.
 */
class ByteSpan : public std::span<const std::byte>
{
public:
    using std::span<const std::byte>::span;
};

/** \brief Compare the contents of two byte spans lexicographically
 */
constexpr auto operator<=>(const ByteSpan& lhs, const ByteSpan& rhs)
{
    return std::lexicographical_compare_three_way(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

/** \brief Compare the contents of two byte spans for equality
 */
constexpr bool operator==(const ByteSpan& lhs, const ByteSpan& rhs)
{
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

/** \brief Copy a contiguous range of bytes into a string
 *
 * \param bytes contiguous range whose elements are one byte wide
 *
 * \return string with the same bytes
 */
template<typename ByteRange>
std::string blobToString(const ByteRange& bytes)
{
    static_assert(
        sizeof(*std::data(bytes)) == 1, "Elements must be one byte wide");
    const auto* first = reinterpret_cast<const char*>(std::data(bytes));
    return std::string(first, first + std::size(bytes));
}

/** \brief Copy the characters of a string into a blob
 *
 * \param string contiguous range whose elements are one byte wide
 *
 * \return blob with the same bytes
 */
template<typename String>
Blob stringToBlob(const String& string)
{
    static_assert(
        sizeof(*std::data(string)) == 1, "Elements must be one byte wide");
    const auto* first = reinterpret_cast<const std::byte*>(std::data(string));
    return Blob(first, first + std::size(string));
}

/** \brief View a contiguous container of bytes as ByteSpan
 *
 * \p container is a string, a blob, a ZeroMQ message or another contiguous
 * container whose size is its length in bytes.
 *
 * \param container the container
 *
 * \return byte span covering the contents of \p container
 */
template<typename Container>
ByteSpan asBytes(const Container& container)
{
    const auto* first = reinterpret_cast<const std::byte*>(
        std::data(container));
    return ByteSpan(first, static_cast<ByteSpan::size_type>(
        std::size(container)));
}

inline namespace BlobLiterals {

/** \brief Blob literal
 */
inline Blob operator"" _B(const char* str, std::size_t len)
{
    const auto* first = reinterpret_cast<const std::byte*>(str);
    return Blob(first, first + len);
}

/** \brief Byte span literal
 */
inline ByteSpan operator"" _BS(const char* str, std::size_t len)
{
    return ByteSpan(reinterpret_cast<const std::byte*>(str), len);
}

}

}

#endif // BLOB_HH_
