// File: io/record_reader.cpp

#include "io/record_reader.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <fmt/format.h>

#include "common/utilities/file_utils.hpp"

namespace io {

    namespace {
        constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

        std::string_view trim(std::string_view text) noexcept {
            while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
                text.remove_prefix(1);
            }
            while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
                text.remove_suffix(1);
            }
            return text;
        }

        using ColumnIndex = std::unordered_map<std::string, std::size_t>;

        std::optional<std::size_t> column(const ColumnIndex &columns, const std::string &name) {
            const auto it = columns.find(name);
            return it == columns.end() ? std::nullopt : std::optional<std::size_t>(it->second);
        }
    } // namespace

    std::vector<std::string> RecordReader::splitLine(const std::string_view line) {
        std::vector<std::string> cells;
        std::string cell;
        bool quoted = false;

        for (std::size_t i = 0; i < line.size(); ++i) {
            const char ch = line[i];
            if (quoted) {
                if (ch == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                    cell.push_back('"');
                    ++i;
                } else if (ch == '"') {
                    quoted = false;
                } else {
                    cell.push_back(ch);
                }
            } else if (ch == '"') {
                quoted = true;
            } else if (ch == ',') {
                cells.emplace_back(trim(cell));
                cell.clear();
            } else {
                cell.push_back(ch);
            }
        }
        cells.emplace_back(trim(cell));
        return cells;
    }

    std::optional<double> RecordReader::parseNumber(std::string_view cell) {
        cell = trim(cell);
        if (cell.empty()) {
            return std::nullopt;
        }
        if (cell.front() == '+') {
            cell.remove_prefix(1);
        }

        double value = 0.0;
        const auto [end, error] = std::from_chars(cell.data(), cell.data() + cell.size(), value);
        if (error != std::errc() || end != cell.data() + cell.size()) {
            throw std::invalid_argument(fmt::format("'{}' is not a number", cell));
        }
        return value;
    }

    std::vector<RawRecord> RecordReader::parse(const std::string &content) {
        std::istringstream stream(content);
        std::string line;

        if (!std::getline(stream, line)) {
            throw std::runtime_error("Record file is empty; a header row is required.");
        }
        // Spreadsheet exports often prefix the file with a UTF-8 byte order mark.
        if (line.starts_with(kUtf8Bom)) {
            line.erase(0, kUtf8Bom.size());
        }

        ColumnIndex columns;
        const auto header = splitLine(line);
        for (std::size_t i = 0; i < header.size(); ++i) {
            columns.emplace(header[i], i);
        }

        const auto id_column = column(columns, "player_id");
        const auto name_column = column(columns, "player_name");
        const auto game_column = column(columns, "game_id");
        const auto minutes_column = column(columns, "minutes");
        const auto seconds_column = column(columns, "seconds");
        if (!id_column) {
            throw std::runtime_error("Record file header has no 'player_id' column.");
        }
        if (!minutes_column && !seconds_column) {
            throw std::runtime_error("Record file header needs a 'minutes' or 'seconds' column.");
        }

        std::array<std::optional<std::size_t>, kStatCount> stat_columns;
        for (std::size_t s = 0; s < kStatCount; ++s) {
            stat_columns[s] = column(columns, std::string(kStatNames[s]));
            if (!stat_columns[s] && s < kRequiredStatCount) {
                throw std::runtime_error(fmt::format("Record file header has no '{}' column.", kStatNames[s]));
            }
        }

        std::vector<RawRecord> records;
        std::size_t line_number = 1;
        std::size_t malformed = 0;

        while (std::getline(stream, line)) {
            ++line_number;
            if (trim(line).empty()) {
                continue;
            }

            const auto cells = splitLine(line);
            const auto cell = [&cells](const std::optional<std::size_t> index) -> std::string_view {
                return index && *index < cells.size() ? std::string_view(cells[*index]) : std::string_view();
            };

            RawRecord record;
            if (const auto id = cell(id_column); !id.empty()) {
                record.player_id = std::string(id);
            }
            record.player_name = std::string(cell(name_column));
            record.game_id = std::string(cell(game_column));

            try {
                if (const auto minutes = parseNumber(cell(minutes_column))) {
                    record.minutes = *minutes;
                } else if (const auto seconds = parseNumber(cell(seconds_column))) {
                    record.minutes = *seconds / 60.0;
                } else {
                    record.minutes = std::numeric_limits<double>::quiet_NaN();
                }

                for (std::size_t s = 0; s < kStatCount; ++s) {
                    if (const auto value = parseNumber(cell(stat_columns[s]))) {
                        record.stats.set(static_cast<Stat>(s), *value);
                    }
                }
            } catch (const std::invalid_argument &e) {
                LOG_WARN("Skipping malformed line {}: {}", line_number, e.what());
                ++malformed;
                continue;
            }

            records.push_back(std::move(record));
        }

        LOG_INFO("Read {} raw records ({} malformed lines skipped)", records.size(), malformed);
        return records;
    }

    std::vector<RawRecord> RecordReader::read(const std::filesystem::path &path) {
        LOG_INFO("Reading raw records from {}", path.string());
        return parse(common::utilities::FileUtils::readFile(path));
    }

} // namespace io
