#pragma once

#include "cdb/fdb/fdb-database.h"
#include "cdb/fdb/fdb-errors.h"
#include <boost/iostreams/device/mapped_file.hpp>
#include <cstdint>
#include <string>

namespace cdb::fdb {

/**
 * MmapReader - Memory-mapped reader for FDB files
 *
 * Maps the whole file read-only and exposes it as a zero-copy Database view.
 * Every Table, Row and Latin1Str obtained through database() points into the
 * mapping, so the reader must outlive all of them.
 */
class MmapReader
{
public:
    /**
     * Map the specified file
     *
     * @param filename Path to the FDB file to read
     * @throws FdbFileError if the file does not exist, is empty or cannot be
     * mapped
     * @throws FdbFormatError if the file is too small for an FDB header
     */
    explicit MmapReader(std::string filename);

    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader&
    operator=(const MmapReader&) = delete;

    const Database&
    database() const
    {
        return database_;
    }

    const std::string&
    filename() const
    {
        return filename_;
    }

    size_t
    file_size() const
    {
        return file_size_;
    }

private:
    // Open and validate the mapping; returns a view over it
    Database
    open();

    std::string filename_;
    boost::iostreams::mapped_file_source mmap_file_;
    const uint8_t* data_ = nullptr;
    size_t file_size_ = 0;
    Database database_;
};

}  // namespace cdb::fdb
