/// @file test_records.cpp
/// @brief Unit tests for export rows and the CSV/JSON writers.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"
#include "core/types.hpp"
#include "ephemeris/snapshot.hpp"
#include "io/csv_writer.hpp"
#include "io/json_writer.hpp"
#include "io/records.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace gochara;
using namespace gochara::io;
using namespace gochara::ephemeris;

int main(int argc, char** argv)
{
    gochara::core::Logger::init(spdlog::level::err);
    const int result = doctest::Context(argc, argv).run();
    gochara::core::Logger::shutdown();
    return result;
}

namespace
{

std::vector<std::string> keys_of(const Record& record)
{
    std::vector<std::string> keys;
    for (const auto& item : record.items())
    {
        keys.push_back(item.key());
    }
    return keys;
}

transit::SampleRecord make_sample()
{
    transit::SampleRecord sample{
        .local      = {.year = 2025, .month = 9, .day = 1, .hour = 0, .minute = 15, .second = 0.0},
        .universal  = {.year = 2025, .month = 8, .day = 31, .hour = 17, .minute = 15, .second = 0.0},
        .julian_day = 2460919.21875,
        .snapshot   = {},
    };

    sample.snapshot.add(SnapshotBuilder::make_position(
        PlanetId::Sun,
        EclipticPosition{.position = Vec3d{134.49876543, 0.0000123, 1.00912345},
                         .velocity = Vec3d{0.9712345678, 0.0, 0.0}},
        false));

    const PlanetPosition rahu = SnapshotBuilder::make_position(
        PlanetId::Rahu,
        EclipticPosition{.position = Vec3d{325.5, 0.0, 0.00257},
                         .velocity = Vec3d{-0.053, 0.0, 0.0}},
        true);
    sample.snapshot.add(rahu);
    sample.snapshot.add(SnapshotBuilder::derive_ketu(rahu));

    return sample;
}

} // anonymous namespace

// =================================================================
// Snapshot rows
// =================================================================

TEST_CASE("Snapshot row starts with the time columns")
{
    const Record row = Records::snapshot_record(make_sample(), 7.0);
    const auto keys = keys_of(row);

    REQUIRE(keys.size() == 6 + 3 * 12);
    CHECK(keys[0] == "date");
    CHECK(keys[1] == "time");
    CHECK(keys[2] == "datetime_local");
    CHECK(keys[3] == "datetime_utc");
    CHECK(keys[4] == "julian_day");
    CHECK(keys[5] == "timezone_offset");

    CHECK(row["date"] == "2025-09-01");
    CHECK(row["time"] == "00:15:00");
    CHECK(row["datetime_local"] == "2025-09-01 00:15:00");
    CHECK(row["datetime_utc"] == "2025-08-31 17:15:00");
    CHECK(row["timezone_offset"].get<f64>() == 7.0);
}

TEST_CASE("Planet columns follow the fixed per-planet order")
{
    const Record row = Records::snapshot_record(make_sample(), 7.0);
    const auto keys = keys_of(row);

    const std::vector<std::string> expected = {
        "Sun_Longitude", "Sun_Latitude", "Sun_Distance", "Sun_Sign", "Sun_Sign_VI",
        "Sun_Degree", "Sun_Degree_Decimal", "Sun_Motion", "Sun_Retrograde",
        "Sun_Speed", "Sun_Symbol", "Sun_Name_VI",
    };
    for (std::size_t i = 0; i < expected.size(); ++i)
    {
        CHECK(keys[6 + i] == expected[i]);
    }

    // Rahu block, then Ketu last
    CHECK(keys[18] == "Rahu_Longitude");
    CHECK(keys[30] == "Ketu_Longitude");
    CHECK(keys.back() == "Ketu_Name_VI");
}

TEST_CASE("Planet values are rounded and classified")
{
    const Record row = Records::snapshot_record(make_sample(), 7.0);

    CHECK(row["Sun_Longitude"].get<f64>() == doctest::Approx(134.498765).epsilon(1e-12));
    CHECK(row["Sun_Distance"].get<f64>() == doctest::Approx(1.009123).epsilon(1e-12));
    CHECK(row["Sun_Speed"].get<f64>() == doctest::Approx(0.971235).epsilon(1e-12));
    CHECK(row["Sun_Sign"] == "Leo");
    CHECK(row["Sun_Degree"] == "14°29'55\"");
    CHECK(row["Sun_Motion"] == "D");
    CHECK(row["Sun_Retrograde"] == false);

    CHECK(row["Rahu_Sign"] == "Aquarius");
    CHECK(row["Rahu_Motion"] == "R");
    CHECK(row["Ketu_Sign"] == "Leo");
    CHECK(row["Ketu_Longitude"].get<f64>() == doctest::Approx(145.5));
    CHECK(row["Ketu_Retrograde"] == true);
}

TEST_CASE("round_to rounds the exact binary value")
{
    CHECK(Records::round_to(1.23456789, 4) == doctest::Approx(1.2346));
    CHECK(Records::round_to(-1.23456, 4) == doctest::Approx(-1.2346));
    CHECK(Records::round_to(359.9999999, 6) == doctest::Approx(360.0));

    // Stored just below the decimal midpoint, although value × 10^d lands on it
    CHECK(Records::round_to(0.015, 2) == 0.01);
    CHECK(Records::round_to(0.045, 2) == 0.04);
    CHECK(Records::round_to(3.5e-06, 6) == 3e-06);
}

// =================================================================
// Event rows
// =================================================================

TEST_CASE("Aspect row key order and rounding")
{
    const events::AspectEvent aspect{
        .type               = events::AspectType::Trine,
        .planet1            = PlanetId::Sun,
        .planet1_sign_index = 4,
        .planet1_degree     = "14°29'55\"",
        .planet2            = PlanetId::Jupiter,
        .planet2_sign_index = 0,
        .planet2_degree     = "15°00'00\"",
        .exact_angle        = 120,
        .difference         = 120.512345,
        .orb_residual       = 0.512345,
        .datetime           = "2025-09-03 06:45:00",
    };

    const Record row = Records::aspect_record(aspect);
    const std::vector<std::string> expected = {
        "datetime", "event", "type", "planet1", "planet1_sign", "planet1_degree",
        "planet2", "planet2_sign", "planet2_degree", "exact_angle", "difference", "orb",
    };
    CHECK(keys_of(row) == expected);

    CHECK(row["event"] == "Aspect");
    CHECK(row["type"] == "Trine");
    CHECK(row["planet2"] == "Jupiter");
    CHECK(row["planet2_sign"] == "Aries");
    CHECK(row["exact_angle"] == 120);
    CHECK(row["difference"].get<f64>() == doctest::Approx(120.5123));
    CHECK(row["orb"].get<f64>() == doctest::Approx(0.5123));
}

TEST_CASE("Ingress row key order")
{
    const events::IngressEvent ingress{
        .planet          = PlanetId::Moon,
        .from_sign_index = 3,
        .to_sign_index   = 4,
        .degree          = "0°04'48\"",
        .longitude       = 120.08,
        .datetime        = "2025-09-02 11:30:00",
    };

    const Record row = Records::ingress_record(ingress);
    const std::vector<std::string> expected = {
        "datetime", "event", "planet", "from_sign", "to_sign", "degree", "longitude",
    };
    CHECK(keys_of(row) == expected);
    CHECK(row["event"] == "Ingress");
    CHECK(row["from_sign"] == "Cancer");
    CHECK(row["to_sign"] == "Leo");
}

TEST_CASE("Run metadata names the coordinate system")
{
    const transit::RunParameters params{
        .year              = 2025,
        .month             = 9,
        .utc_offset_hours  = 7.0,
        .step_minutes      = 15,
        .orb_deg           = 1.0,
        .retrograde_method = RetrogradeMethod::Speed,
    };

    const Record metadata = Records::run_metadata(params, "Swiss Ephemeris", "2025-09-01T08:00:00");
    CHECK(metadata["year"] == 2025);
    CHECK(metadata["month"] == 9);
    CHECK(metadata["coordinate_system"] == "Sidereal Zodiac (Lahiri)");
    CHECK(metadata["node_type"] == "Mean Node");
    CHECK(metadata["ephemeris_type"] == "Swiss Ephemeris");
    CHECK(metadata["calculation_time"] == "2025-09-01T08:00:00");
}

// =================================================================
// CSV
// =================================================================

TEST_CASE("CSV cells")
{
    CHECK(CsvWriter::cell_text(Record("Leo")) == "Leo");
    CHECK(CsvWriter::cell_text(Record(true)) == "True");
    CHECK(CsvWriter::cell_text(Record(false)) == "False");
    CHECK(CsvWriter::cell_text(Record(120)) == "120");
    CHECK(CsvWriter::cell_text(Record(7.0)) == "7.0");
    CHECK(CsvWriter::cell_text(Record(nullptr)).empty());
}

TEST_CASE("CSV escaping")
{
    CHECK(CsvWriter::escape("Leo") == "Leo");
    CHECK(CsvWriter::escape("10°00'00\"") == "\"10°00'00\"\"\"");
    CHECK(CsvWriter::escape("a,b") == "\"a,b\"");
    CHECK(CsvWriter::escape("line\nbreak") == "\"line\nbreak\"");
}

TEST_CASE("CSV rows use the first record's header and CRLF")
{
    Table table(2);
    table[0]["planet"] = "Moon";
    table[0]["retro"]  = false;
    table[1]["planet"] = "Mars";
    table[1]["retro"]  = true;

    std::ostringstream out;
    CsvWriter::write_rows(table, out);

    CHECK(out.str() == "planet,retro\r\nMoon,False\r\nMars,True\r\n");
}

TEST_CASE("CSV rows leave missing keys empty")
{
    Table table(2);
    table[0]["a"] = 1;
    table[0]["b"] = 2;
    table[1]["b"] = 3;

    std::ostringstream out;
    CsvWriter::write_rows(table, out);

    CHECK(out.str() == "a,b\r\n1,2\r\n,3\r\n");
}

// =================================================================
// JSON
// =================================================================

TEST_CASE("JSON document wraps metadata, count and data")
{
    Table table(3);
    for (std::size_t i = 0; i < table.size(); ++i)
    {
        table[i]["index"] = i;
    }
    Record metadata;
    metadata["year"] = 2025;

    const Record document = JsonWriter::make_document(table, metadata);
    CHECK(keys_of(document) == std::vector<std::string>{"metadata", "total_records", "data"});
    CHECK(document["total_records"] == 3);
    CHECK(document["data"].size() == 3);
    CHECK(document["metadata"]["year"] == 2025);
}

TEST_CASE("JSON document without metadata carries an empty object")
{
    Table table(1);
    table[0]["x"] = 1;

    const Record document = JsonWriter::make_document(table, Record{});
    CHECK(document["metadata"].is_object());
    CHECK(document["metadata"].empty());
}
