/**
 * image_writer.cpp
 *
 * Each row is "AAAA: w w w w w w w w" with the row's first address in hex
 * and every cell as 16 hex digits, two's complement.
 */

#include "image_writer.hpp"

void ImageWriter::write(std::ostream& out, const std::vector<Word>& cells) {
    out << HEADER << "\n";

    for (size_t row = 0; row < cells.size(); row += WORDS_PER_ROW) {
        out << std::hex << std::setfill('0') << std::setw(4) << row << ":";
        for (size_t i = row; i < row + WORDS_PER_ROW && i < cells.size(); i++) {
            out << " " << std::setw(16) << static_cast<UWord>(cells[i]);
        }
        out << "\n";
    }
    out << std::dec << std::setfill(' ');
}

bool ImageWriter::write_file(const std::string& filename, const std::vector<Word>& cells) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    write(file, cells);
    return static_cast<bool>(file);
}
