#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "comparison.hpp"
#include "logger.hpp"
#include "io/parquet_writer.hpp"
#include "fixtures.hpp"
#include <filesystem>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#endif

using namespace nestegg;
using namespace nestegg::io;

namespace {

ComparisonResult make_comparison() {
    LoggerConfig quiet;
    quiet.enable_console = false;
    Logger::get_instance().configure(quiet);

    ScenarioSet scenarios;
    scenarios.add(fixtures::make_spending_scenario());
    return compare_scenarios(fixtures::make_household(), fixtures::make_plan(), scenarios);
}

} // anonymous namespace

#ifdef HAVE_ARROW

TEST_CASE("Parquet I/O - ComparisonResult export", "[parquet][io]") {
    REQUIRE(ParquetWriter::available());

    SECTION("write_comparison requires yearly rows") {
        ComparisonResult empty_result;

        REQUIRE_THROWS_WITH(
            ParquetWriter::write_comparison(empty_result, "output.parquet"),
            Catch::Matchers::ContainsSubstring("no yearly rows")
        );
    }

    SECTION("write_comparison creates valid Parquet file") {
        ComparisonResult result = make_comparison();

        std::string test_output = "test_comparison.parquet";

        // Clean up any existing file
        if (std::filesystem::exists(test_output)) {
            std::filesystem::remove(test_output);
        }

        REQUIRE_NOTHROW(ParquetWriter::write_comparison(result, test_output));

        // Two series of eight years
        REQUIRE(std::filesystem::exists(test_output));
        REQUIRE(std::filesystem::file_size(test_output) > 0);

        std::filesystem::remove(test_output);
    }

    SECTION("Money columns are exact decimals") {
        ComparisonResult result = make_comparison();
        std::string test_output = "test_comparison_money.parquet";
        REQUIRE_NOTHROW(ParquetWriter::write_comparison(result, test_output));

        std::shared_ptr<arrow::io::ReadableFile> infile;
        REQUIRE(arrow::io::ReadableFile::Open(test_output, arrow::default_memory_pool(), &infile).ok());
        std::unique_ptr<parquet::arrow::FileReader> reader;
        REQUIRE(parquet::arrow::OpenFile(infile, arrow::default_memory_pool(), &reader).ok());
        std::shared_ptr<arrow::Table> table;
        REQUIRE(reader->ReadTable(&table).ok());

        REQUIRE(table->num_rows() == 16);
        REQUIRE(table->schema()->GetFieldByName("nest_egg")->type()->Equals(arrow::decimal128(38, 2)));
        REQUIRE(table->schema()->GetFieldByName("net_worth")->type()->Equals(arrow::decimal128(38, 2)));

        // Base series: first and last year
        auto nest_egg = std::static_pointer_cast<arrow::Decimal128Array>(
            table->GetColumnByName("nest_egg")->chunk(0));
        REQUIRE(nest_egg->FormatValue(0) == "530000.00");
        REQUIRE(nest_egg->FormatValue(7) == "796924.04");

        std::filesystem::remove(test_output);
    }

    SECTION("Failed series contribute no rows") {
        ComparisonResult result = make_comparison();
        result.series[1].failed = true;

        std::string test_output = "test_comparison_failed.parquet";
        REQUIRE_NOTHROW(ParquetWriter::write_comparison(result, test_output));
        REQUIRE(std::filesystem::exists(test_output));
        std::filesystem::remove(test_output);
    }

    SECTION("Unwritable path") {
        ComparisonResult result = make_comparison();
        REQUIRE_THROWS_AS(ParquetWriter::write_comparison(result, "/nonexistent-dir/out.parquet"),
                          std::runtime_error);
    }
}

#else // !HAVE_ARROW

TEST_CASE("Parquet I/O - Not available without Arrow", "[parquet]") {
    REQUIRE_FALSE(ParquetWriter::available());

    ComparisonResult result = make_comparison();
    REQUIRE_THROWS_WITH(
        ParquetWriter::write_comparison(result, "test.parquet"),
        Catch::Matchers::ContainsSubstring("Apache Arrow not available")
    );
    REQUIRE_FALSE(std::filesystem::exists("test.parquet"));
}

#endif // HAVE_ARROW
