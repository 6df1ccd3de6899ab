#include "formula/address.hpp"
#include <cctype>
#include <cstdint>

namespace formula {

std::uint32_t column_to_index(std::string_view letters){
    std::uint32_t v = 0;
    for(char c : letters){
        v = v*26 + static_cast<std::uint32_t>(std::toupper((unsigned char)c) - 'A' + 1);
    }
    return v - 1;
}

std::uint32_t row_to_index(std::string_view digits){
    std::uint32_t v = 0;
    for(char c : digits) v = v*10 + static_cast<std::uint32_t>(c - '0');
    return v - 1;
}

namespace {
// Largest one-based row or column ordinal that still has a uint32_t index.
constexpr std::uint64_t max_ordinal = std::uint64_t(UINT32_MAX) + 1;
}

bool is_cell_name(std::string_view text){
    size_t i = 0;
    std::uint64_t col = 0;
    for(; i<text.size() && std::isalpha((unsigned char)text[i]); ++i){
        col = col*26 + static_cast<std::uint64_t>(std::toupper((unsigned char)text[i]) - 'A' + 1);
        if(col > max_ordinal) return false;
    }
    if(i == 0 || i == text.size()) return false;
    std::uint64_t row = 0;
    for(; i<text.size(); ++i){
        if(!std::isdigit((unsigned char)text[i])) return false;
        row = row*10 + static_cast<std::uint64_t>(text[i] - '0');
        if(row > max_ordinal) return false;
    }
    // row 0 does not exist
    return row != 0;
}

bool is_range_name(std::string_view text){
    auto colon = text.find(':');
    return colon != std::string_view::npos && is_cell_name(text.substr(0, colon)) && is_cell_name(text.substr(colon+1));
}

cell_address parse_cell(std::string_view text){
    size_t i = 0;
    while(i<text.size() && std::isalpha((unsigned char)text[i])) ++i;
    return cell_address{ row_to_index(text.substr(i)), column_to_index(text.substr(0, i)) };
}

range_address parse_range(std::string_view text){
    auto colon = text.find(':');
    auto a = parse_cell(text.substr(0, colon));
    auto b = parse_cell(colon==std::string_view::npos ? text : text.substr(colon+1));
    return range_address{ a.row, a.col, b.row, b.col };
}

std::string index_to_column(std::uint32_t col){
    std::string out;
    std::uint64_t n = std::uint64_t(col) + 1;
    while(n > 0){
        auto rem = (n - 1) % 26;
        out.insert(out.begin(), static_cast<char>('A' + rem));
        n = (n - 1) / 26;
    }
    return out;
}

std::string cell_name(std::uint32_t row, std::uint32_t col){
    return index_to_column(col) + std::to_string(std::uint64_t(row) + 1);
}

std::string range_name(const range_address& r){
    return cell_name(r.start_row, r.start_col) + ":" + cell_name(r.end_row, r.end_col);
}

} // namespace formula
