/**
 * image_writer.hpp
 *
 * Writes memory contents as a Logisim "v3.0 hex words addressed" image,
 * the format the RAM component loads.
 */

#ifndef IMAGE_WRITER_HPP
#define IMAGE_WRITER_HPP

#include "common.hpp"

class ImageWriter {
public:
    static constexpr const char* HEADER = "v3.0 hex words addressed";
    static constexpr size_t WORDS_PER_ROW = 8;

    static void write(std::ostream& out, const std::vector<Word>& cells);

    // Returns false if the file cannot be opened
    static bool write_file(const std::string& filename, const std::vector<Word>& cells);
};

#endif // IMAGE_WRITER_HPP
