#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace nestegg {
namespace io {

#ifdef HAVE_ARROW

namespace {

// Money columns hold exact cents
constexpr int32_t MONEY_PRECISION = 38;
constexpr int32_t MONEY_SCALE = 2;

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

// format_money always yields two decimals, matching MONEY_SCALE
arrow::Decimal128 to_money(const Decimal& value) {
    const std::string text = format_money(value);
    auto parsed = arrow::Decimal128::FromString(text);
    if (!parsed.ok()) {
        throw std::runtime_error("Failed to convert " + text + " to decimal128: " +
                                 parsed.status().ToString());
    }
    return *parsed;
}

} // anonymous namespace

bool ParquetWriter::available() {
    return true;
}

void ParquetWriter::write_comparison(const ComparisonResult& result, const std::string& filepath) {
    size_t rows = 0;
    for (const auto& series : result.series) {
        if (!series.failed) rows += series.projection.years.size();
    }
    if (rows == 0) {
        throw std::runtime_error("ComparisonResult has no yearly rows to write");
    }

    // Build Arrow schema
    auto schema = arrow::schema({
        arrow::field("scenario", arrow::utf8()),
        arrow::field("year", arrow::int32()),
        arrow::field("age", arrow::int32()),
        arrow::field("nest_egg", arrow::decimal128(MONEY_PRECISION, MONEY_SCALE)),
        arrow::field("net_worth", arrow::decimal128(MONEY_PRECISION, MONEY_SCALE))
    });

    arrow::StringBuilder scenario_builder;
    arrow::Int32Builder year_builder;
    arrow::Int32Builder age_builder;
    arrow::Decimal128Builder nest_egg_builder(arrow::decimal128(MONEY_PRECISION, MONEY_SCALE));
    arrow::Decimal128Builder net_worth_builder(arrow::decimal128(MONEY_PRECISION, MONEY_SCALE));

    check(scenario_builder.Reserve(static_cast<int64_t>(rows)), "reserve scenario column");
    check(year_builder.Reserve(static_cast<int64_t>(rows)), "reserve year column");
    check(age_builder.Reserve(static_cast<int64_t>(rows)), "reserve age column");
    check(nest_egg_builder.Reserve(static_cast<int64_t>(rows)), "reserve nest_egg column");
    check(net_worth_builder.Reserve(static_cast<int64_t>(rows)), "reserve net_worth column");

    for (const auto& series : result.series) {
        if (series.failed) continue;
        for (const auto& y : series.projection.years) {
            check(scenario_builder.Append(series.name), "append scenario");
            check(year_builder.Append(y.year), "append year");
            check(age_builder.Append(y.reference_age), "append age");
            check(nest_egg_builder.Append(to_money(y.nest_egg)), "append nest_egg");
            check(net_worth_builder.Append(to_money(y.net_worth)), "append net_worth");
        }
    }

    std::shared_ptr<arrow::Array> scenario_array;
    std::shared_ptr<arrow::Array> year_array;
    std::shared_ptr<arrow::Array> age_array;
    std::shared_ptr<arrow::Array> nest_egg_array;
    std::shared_ptr<arrow::Array> net_worth_array;
    check(scenario_builder.Finish(&scenario_array), "finish scenario array");
    check(year_builder.Finish(&year_array), "finish year array");
    check(age_builder.Finish(&age_array), "finish age array");
    check(nest_egg_builder.Finish(&nest_egg_array), "finish nest_egg array");
    check(net_worth_builder.Finish(&net_worth_array), "finish net_worth array");

    auto table = arrow::Table::Make(schema, {scenario_array, year_array, age_array,
                                             nest_egg_array, net_worth_array});

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

bool ParquetWriter::available() {
    return false;
}

void ParquetWriter::write_comparison(const ComparisonResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace io
} // namespace nestegg
