#pragma once

/// @file json_writer.hpp
/// @brief Writes record tables as UTF-8 JSON.

#include "io/records.hpp"

#include <filesystem>

namespace gochara::io
{
    /// @brief Static utility class for JSON output (2-space indent, non-ASCII kept as UTF-8).
    class JsonWriter
    {
    public:
        JsonWriter() = delete;

        /// @brief Write {"metadata": …, "total_records": N, "data": [...]}.
        /// @return False if the table is empty (nothing written) or the file cannot be written.
        [[nodiscard]] static bool write_document(const Table& table,
                                                 const std::filesystem::path& path,
                                                 const Record& metadata);

        /// @brief Write the table as a bare JSON array.
        [[nodiscard]] static bool write_array(const Table& table, const std::filesystem::path& path);

        /// @brief The document written by write_document().
        [[nodiscard]] static Record make_document(const Table& table, const Record& metadata);

    private:
        [[nodiscard]] static bool write_value(const Record& value, const std::filesystem::path& path,
                                              std::size_t record_count);
    };

} // namespace gochara::io
