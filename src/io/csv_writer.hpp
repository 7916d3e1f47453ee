#pragma once

/// @file csv_writer.hpp
/// @brief Writes record tables as UTF-8 CSV with a byte-order mark.

#include "io/records.hpp"

#include <filesystem>
#include <ostream>
#include <string>

namespace gochara::io
{
    /// @brief Static utility class for CSV output.
    ///
    /// The header row is the key list of the first record; every row is
    /// written in that key order (missing keys give empty cells). Fields
    /// containing a comma, quote, CR or LF are quoted with doubled quotes.
    /// Rows end with CRLF.
    class CsvWriter
    {
    public:
        CsvWriter() = delete;

        /// @brief Write @p table to @p path.
        /// @return False if the table is empty (nothing written) or the file cannot be written.
        [[nodiscard]] static bool write(const Table& table, const std::filesystem::path& path);

        /// @brief Stream form used by write(); no BOM.
        static void write_rows(const Table& table, std::ostream& out);

        /// @brief Text of one cell: strings verbatim, booleans True/False, numbers as JSON.
        [[nodiscard]] static std::string cell_text(const Record& value);

        /// @brief Quote a field if it needs it.
        [[nodiscard]] static std::string escape(const std::string& field);
    };

} // namespace gochara::io
