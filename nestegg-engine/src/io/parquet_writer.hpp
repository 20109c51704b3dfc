#ifndef NESTEGG_IO_PARQUET_WRITER_HPP
#define NESTEGG_IO_PARQUET_WRITER_HPP

#include "../comparison.hpp"
#include <string>

namespace nestegg {
namespace io {

class ParquetWriter {
public:
    /**
     * Write comparison results to a Parquet file, one row per (series, year).
     *
     * Output schema:
     *   - scenario: utf8 ("base" or the scenario name)
     *   - year: int32
     *   - age: int32 (reference person)
     *   - nest_egg: decimal128(38, 2), exact cents
     *   - net_worth: decimal128(38, 2)
     *
     * Failed series contribute no rows.
     *
     * @param result ComparisonResult to write
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if file cannot be written or Arrow support is not built in
     */
    static void write_comparison(const ComparisonResult& result, const std::string& filepath);

    // False when built without Apache Arrow
    static bool available();
};

} // namespace io
} // namespace nestegg

#endif // NESTEGG_IO_PARQUET_WRITER_HPP
