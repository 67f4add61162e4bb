#pragma once

#include "cdb/fdb/fdb-database.h"
#include "cdb/test-utils/fdb-builder.h"
#include <optional>
#include <string>
#include <vector>

namespace typed_test {

using cdb::test::Cell;

inline Cell
text(const char* s)
{
    return std::string(s);
}

inline Cell
null()
{
    return std::monostate{};
}

// Owns a built image and the Database view over it
class BuiltImage
{
public:
    explicit BuiltImage(const cdb::test::FdbBuilder& builder)
        : bytes_(builder.build()), db_(bytes_.data(), bytes_.size())
    {
    }

    BuiltImage(const BuiltImage&) = delete;
    BuiltImage&
    operator=(const BuiltImage&) = delete;

    const cdb::fdb::Database&
    db() const
    {
        return db_;
    }

    cdb::fdb::Table
    table(const std::string& name) const
    {
        return *db_.table_by_name(name);
    }

private:
    std::vector<uint8_t> bytes_;
    cdb::fdb::Database db_;
};

}  // namespace typed_test
