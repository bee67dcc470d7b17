#pragma once

namespace tasktracker {
namespace data {

enum class StorageError
{
    NoError,
    MalformedData,
    ReadFailed,
    WriteFailed,
};

} // namespace data
} // namespace tasktracker
