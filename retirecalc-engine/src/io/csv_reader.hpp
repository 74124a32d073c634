#ifndef RETIRECALC_CSV_READER_HPP
#define RETIRECALC_CSV_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace retirecalc {

// Minimal delimited-text reader for return series files. Blank lines and lines
// starting with '#' are skipped; cells are whitespace-trimmed.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next data row, or an empty vector at end of input
    std::vector<std::string> read_row();
    bool has_more();

    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    void skip_ignorable_lines();
    static std::string trim(const std::string& s);
};

} // namespace retirecalc

#endif // RETIRECALC_CSV_READER_HPP
