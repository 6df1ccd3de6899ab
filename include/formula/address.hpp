// Spreadsheet-style address helpers ("B3", "A1:C4") with zero-based coordinates.
#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace formula {

struct cell_address { std::uint32_t row = 0; std::uint32_t col = 0; };
struct range_address { std::uint32_t start_row = 0; std::uint32_t start_col = 0; std::uint32_t end_row = 0; std::uint32_t end_col = 0; };

// "A" -> 0, "Z" -> 25, "AA" -> 26. Bijective base 26.
std::uint32_t column_to_index(std::string_view letters);
// "1" -> 0
std::uint32_t row_to_index(std::string_view digits);

// Letters then digits, row at least 1, row and column both representable as uint32_t.
bool is_cell_name(std::string_view text);
// Two valid cell names joined by ':'.
bool is_range_name(std::string_view text);

// Split letter prefix / digit suffix. Input must satisfy is_cell_name.
cell_address parse_cell(std::string_view text);
// Split on ':' and resolve both sides with parse_cell.
range_address parse_range(std::string_view text);

// Inverses, used when printing.
std::string index_to_column(std::uint32_t col);
std::string cell_name(std::uint32_t row, std::uint32_t col);
std::string range_name(const range_address& r);

} // namespace formula
