#pragma once

#include <stdexcept>
#include <string>

namespace cdb::fdb {

// Base exception for FDB store errors
class FdbError : public std::runtime_error
{
public:
    explicit FdbError(const std::string& msg) : std::runtime_error(msg)
    {
    }
};

// An address, length or type code in the image is invalid
class FdbFormatError : public FdbError
{
public:
    explicit FdbFormatError(const std::string& msg) : FdbError(msg)
    {
    }
};

// The file could not be opened or mapped
class FdbFileError : public FdbError
{
public:
    explicit FdbFileError(const std::string& msg) : FdbError(msg)
    {
    }
};

}  // namespace cdb::fdb
