// File: io/record_reader.hpp

#ifndef RECORD_READER_HPP
#define RECORD_READER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/logging/logger.hpp"
#include "types/raw_record.hpp"

namespace io {

    /*
     * Reads game stat-lines from a headered CSV file, one record per line. Columns are matched by
     * header name in any order:
     *   player_id, player_name, game_id, minutes (or seconds), pts, ast, orb, drb, stl, blk, tov,
     *   fga, fgm, 3pa, 3pm, fta, ftm, pf, and optionally interior_a, interior_m, exterior_a, exterior_m.
     * An empty cell is a missing value; a missing player_id cell yields a record without identifier.
     * A line with a non-numeric stat or minutes cell is skipped with a warning.
     */
    class RecordReader {
    public:
        // Throws std::runtime_error when the file cannot be read or the header lacks a required column.
        [[nodiscard]] static std::vector<RawRecord> read(const std::filesystem::path &path);

        [[nodiscard]] static std::vector<RawRecord> parse(const std::string &content);

        // Splits one CSV line; double quotes enclose fields with commas, "" is a literal quote.
        [[nodiscard]] static std::vector<std::string> splitLine(std::string_view line);

    private:
        [[nodiscard]] static std::optional<double> parseNumber(std::string_view cell);
    };

} // namespace io

#endif // RECORD_READER_HPP
