#include "cdb/fdb/fdb-mmap-reader.h"
#include "cdb/core/logger.h"
#include <boost/filesystem.hpp>
#include <utility>

namespace cdb::fdb {

MmapReader::MmapReader(std::string filename)
    : filename_(std::move(filename)), database_(open())
{
    LOGI(
        "Mapped ",
        filename_,
        " (",
        file_size_,
        " bytes, ",
        database_.table_count(),
        " tables)");
}

MmapReader::~MmapReader()
{
    if (mmap_file_.is_open())
    {
        mmap_file_.close();
    }
}

Database
MmapReader::open()
{
    try
    {
        if (!boost::filesystem::exists(filename_))
        {
            throw FdbFileError("File does not exist: " + filename_);
        }

        boost::uintmax_t file_size = boost::filesystem::file_size(filename_);
        if (file_size == 0)
        {
            throw FdbFileError("File is empty: " + filename_);
        }

        mmap_file_.open(filename_);
        if (!mmap_file_.is_open())
        {
            throw FdbFileError("Failed to memory map file: " + filename_);
        }

        data_ = reinterpret_cast<const uint8_t*>(mmap_file_.data());
        file_size_ = mmap_file_.size();

        if (!data_)
        {
            throw FdbFileError(
                "Memory mapping succeeded but data pointer is null");
        }
    }
    catch (const boost::filesystem::filesystem_error& e)
    {
        throw FdbFileError("Filesystem error: " + std::string(e.what()));
    }
    catch (const std::ios_base::failure& e)
    {
        throw FdbFileError("I/O error: " + std::string(e.what()));
    }

    return Database(data_, file_size_);
}

}  // namespace cdb::fdb
