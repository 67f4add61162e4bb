#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <string>
#include <string_view>

namespace cdb {

/**
 * Zero-copy reference to Latin-1 encoded text.
 *
 * Points into the backing buffer of an opened database; it does not own the
 * bytes and must not outlive the buffer. Comparison is byte-wise. Use
 * decode() to obtain an owned UTF-8 string.
 */
class Latin1Str
{
private:
    const uint8_t* data_;
    size_t size_;

public:
    Latin1Str() : data_(nullptr), size_(0)
    {
    }
    Latin1Str(const uint8_t* data, size_t size) : data_(data), size_(size)
    {
    }

    // For literals and test fixtures; the characters are taken as bytes
    static Latin1Str
    from(std::string_view bytes)
    {
        return Latin1Str(
            reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
    }

    const uint8_t*
    data() const
    {
        return data_;
    }
    size_t
    size() const
    {
        return size_;
    }
    bool
    empty() const
    {
        return size_ == 0;
    }

    std::string_view
    view() const
    {
        return {reinterpret_cast<const char*>(data_), size_};
    }

    /**
     * Decode to UTF-8. Bytes below 0x80 map to themselves, the rest to the
     * two-byte sequence of the same code point.
     */
    std::string
    decode() const;

    bool
    operator==(const Latin1Str& other) const
    {
        return size_ == other.size_ &&
            (size_ == 0 || std::memcmp(data_, other.data_, size_) == 0);
    }
    bool
    operator!=(const Latin1Str& other) const
    {
        return !(*this == other);
    }
};

std::ostream&
operator<<(std::ostream& os, const Latin1Str& str);

}  // namespace cdb
