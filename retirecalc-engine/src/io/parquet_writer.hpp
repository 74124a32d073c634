#ifndef RETIRECALC_PARQUET_WRITER_HPP
#define RETIRECALC_PARQUET_WRITER_HPP

#include "../batch_orchestrator.hpp"
#include <string>

namespace retirecalc {

class ParquetWriter {
public:
    /**
     * Write the batch's percentile balance series to a Parquet file.
     *
     * Output schema (one row per year index):
     *   - year_index: int32 (0 = today)
     *   - year: int32 (calendar year)
     *   - real_p10 .. real_p90: float64
     *   - nominal_p10 .. nominal_p90: float64
     *
     * @param batch BatchSummary with non-empty percentile series
     * @param first_year Calendar year of index 0
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the batch is empty, Arrow is unavailable,
     *         or the file cannot be written
     */
    static void write_percentiles(const BatchSummary& batch, int first_year,
                                  const std::string& filepath);
};

} // namespace retirecalc

#endif // RETIRECALC_PARQUET_WRITER_HPP
