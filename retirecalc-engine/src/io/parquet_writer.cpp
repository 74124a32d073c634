#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace retirecalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> double_column(const std::vector<double>& values,
                                            const std::string& name) {
    arrow::DoubleBuilder builder;
    check(builder.Reserve(static_cast<int64_t>(values.size())), "reserve " + name + " column");
    check(builder.AppendValues(values), "append " + name);

    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + name + " array");
    return array;
}

} // anonymous namespace

void ParquetWriter::write_percentiles(const BatchSummary& batch, int first_year,
                                      const std::string& filepath) {
    const size_t rows = batch.real.size();
    if (rows == 0) {
        throw std::runtime_error("BatchSummary has no percentile series to write.");
    }

    auto schema = arrow::schema({
        arrow::field("year_index", arrow::int32()),
        arrow::field("year", arrow::int32()),
        arrow::field("real_p10", arrow::float64()),
        arrow::field("real_p25", arrow::float64()),
        arrow::field("real_p50", arrow::float64()),
        arrow::field("real_p75", arrow::float64()),
        arrow::field("real_p90", arrow::float64()),
        arrow::field("nominal_p10", arrow::float64()),
        arrow::field("nominal_p25", arrow::float64()),
        arrow::field("nominal_p50", arrow::float64()),
        arrow::field("nominal_p75", arrow::float64()),
        arrow::field("nominal_p90", arrow::float64())
    });

    arrow::Int32Builder index_builder;
    arrow::Int32Builder year_builder;
    check(index_builder.Reserve(static_cast<int64_t>(rows)), "reserve year_index column");
    check(year_builder.Reserve(static_cast<int64_t>(rows)), "reserve year column");
    for (size_t i = 0; i < rows; ++i) {
        check(index_builder.Append(static_cast<int32_t>(i)), "append year_index");
        check(year_builder.Append(first_year + static_cast<int32_t>(i)), "append year");
    }

    std::shared_ptr<arrow::Array> index_array;
    std::shared_ptr<arrow::Array> year_array;
    check(index_builder.Finish(&index_array), "finish year_index array");
    check(year_builder.Finish(&year_array), "finish year array");

    auto table = arrow::Table::Make(schema, {
        index_array,
        year_array,
        double_column(batch.real.p10, "real_p10"),
        double_column(batch.real.p25, "real_p25"),
        double_column(batch.real.p50, "real_p50"),
        double_column(batch.real.p75, "real_p75"),
        double_column(batch.real.p90, "real_p90"),
        double_column(batch.nominal.p10, "nominal_p10"),
        double_column(batch.nominal.p25, "nominal_p25"),
        double_column(batch.nominal.p50, "nominal_p50"),
        double_column(batch.nominal.p75, "nominal_p75"),
        double_column(batch.nominal.p90, "nominal_p90")
    });

    auto maybe_outfile = arrow::io::FileOutputStream::Open(filepath);
    if (!maybe_outfile.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 maybe_outfile.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *maybe_outfile;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_percentiles(const BatchSummary& /* batch */, int /* first_year */,
                                      const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace retirecalc
