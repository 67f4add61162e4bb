#include "cdb/core/types.h"

#include <ostream>
#include <string>

namespace cdb {

std::string
Latin1Str::decode() const
{
    std::string result;
    result.reserve(size_);
    for (size_t i = 0; i < size_; ++i)
    {
        uint8_t c = data_[i];
        if (c < 0x80)
        {
            result.push_back(static_cast<char>(c));
        }
        else
        {
            result.push_back(static_cast<char>(0xC0 | (c >> 6)));
            result.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return result;
}

std::ostream&
operator<<(std::ostream& os, const Latin1Str& str)
{
    return os << str.decode();
}

}  // namespace cdb
