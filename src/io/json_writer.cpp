/// @file json_writer.cpp
/// @brief JSON table writer.

#include "io/json_writer.hpp"

#include "core/logger.hpp"

#include <fstream>
#include <string>

namespace gochara::io
{

bool JsonWriter::write_document(const Table& table,
                                const std::filesystem::path& path,
                                const Record& metadata)
{
    if (table.empty())
    {
        GCH_CORE_WARN("JsonWriter: No data to export for {}", path.string());
        return false;
    }
    return write_value(make_document(table, metadata), path, table.size());
}

bool JsonWriter::write_array(const Table& table, const std::filesystem::path& path)
{
    if (table.empty())
    {
        GCH_CORE_WARN("JsonWriter: No data to export for {}", path.string());
        return false;
    }
    return write_value(Record(table), path, table.size());
}

Record JsonWriter::make_document(const Table& table, const Record& metadata)
{
    Record document;
    document["metadata"] = metadata.is_null() ? Record::object() : metadata;
    document["total_records"] = table.size();
    document["data"] = table;
    return document;
}

bool JsonWriter::write_value(const Record& value, const std::filesystem::path& path,
                             std::size_t record_count)
{
    std::string text;
    try
    {
        text = value.dump(2, ' ', /*ensure_ascii=*/false);
    }
    catch (const Record::type_error& e)
    {
        GCH_CORE_ERROR("JsonWriter: Cannot serialize {}: {}", path.string(), e.what());
        return false;
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
        GCH_CORE_ERROR("JsonWriter: Failed to open file: {}", path.string());
        return false;
    }

    file << text;
    file.flush();

    if (!file)
    {
        GCH_CORE_ERROR("JsonWriter: Write failed: {}", path.string());
        return false;
    }

    GCH_CORE_INFO("JsonWriter: Exported {} records to {}", record_count, path.string());
    return true;
}

} // namespace gochara::io
