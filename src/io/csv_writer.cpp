/// @file csv_writer.cpp
/// @brief CSV table writer.

#include "io/csv_writer.hpp"

#include "core/logger.hpp"

#include <fstream>
#include <string_view>
#include <vector>

namespace gochara::io
{

namespace
{

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
constexpr std::string_view kLineEnd = "\r\n";

} // anonymous namespace

bool CsvWriter::write(const Table& table, const std::filesystem::path& path)
{
    if (table.empty())
    {
        GCH_CORE_WARN("CsvWriter: No data to export for {}", path.string());
        return false;
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
        GCH_CORE_ERROR("CsvWriter: Failed to open file: {}", path.string());
        return false;
    }

    file << kUtf8Bom;
    write_rows(table, file);
    file.flush();

    if (!file)
    {
        GCH_CORE_ERROR("CsvWriter: Write failed: {}", path.string());
        return false;
    }

    GCH_CORE_INFO("CsvWriter: Exported {} records to {}", table.size(), path.string());
    return true;
}

void CsvWriter::write_rows(const Table& table, std::ostream& out)
{
    if (table.empty())
    {
        return;
    }

    // -----------------------------------------------------------------
    // Header from the first record's keys
    // -----------------------------------------------------------------
    std::vector<std::string> columns;
    for (const auto& item : table.front().items())
    {
        columns.push_back(item.key());
    }

    for (std::size_t c = 0; c < columns.size(); ++c)
    {
        out << (c > 0 ? "," : "") << escape(columns[c]);
    }
    out << kLineEnd;

    // -----------------------------------------------------------------
    // Rows in header order
    // -----------------------------------------------------------------
    for (const Record& record : table)
    {
        for (std::size_t c = 0; c < columns.size(); ++c)
        {
            if (c > 0)
            {
                out << ',';
            }
            const auto it = record.find(columns[c]);
            if (it != record.end())
            {
                out << escape(cell_text(*it));
            }
        }
        out << kLineEnd;
    }
}

std::string CsvWriter::cell_text(const Record& value)
{
    if (value.is_string())
    {
        return value.get<std::string>();
    }
    if (value.is_boolean())
    {
        return value.get<bool>() ? "True" : "False";
    }
    if (value.is_null())
    {
        return {};
    }
    return value.dump();
}

std::string CsvWriter::escape(const std::string& field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos)
    {
        return field;
    }

    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted.push_back('"');
    for (const char ch : field)
    {
        if (ch == '"')
        {
            quoted.push_back('"');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

} // namespace gochara::io
