#include "cell_codec.hpp"

#include <charconv>
#include <stdexcept>

namespace airspace::db::sql {

std::string FormatCellList(const model::CellSet& cells, char open, char close) {
  std::string out;
  out.reserve(cells.size() * 20 + 2);
  out.push_back(open);
  for (std::size_t i = 0; i < cells.size(); ++i) {
    if (i > 0) out.push_back(',');
    out += std::to_string(cells[i]);
  }
  out.push_back(close);
  return out;
}

model::CellSet ParseCellList(std::string_view text) {
  auto trim = [](std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\n' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\n' || s.back() == '\t')) s.remove_suffix(1);
    return s;
  };

  text = trim(text);
  if (!text.empty() && (text.front() == '[' || text.front() == '{')) {
    const char close = text.front() == '[' ? ']' : '}';
    if (text.size() < 2 || text.back() != close) {
      throw std::invalid_argument("unterminated cell list");
    }
    text = trim(text.substr(1, text.size() - 2));
  }

  model::CellSet cells;
  while (!text.empty()) {
    auto comma = text.find(',');
    auto item  = trim(text.substr(0, comma));

    model::CellId value = 0;
    auto [ptr, ec]      = std::from_chars(item.data(), item.data() + item.size(), value);
    if (ec != std::errc() || ptr != item.data() + item.size() || item.empty()) {
      throw std::invalid_argument("invalid cell id '" + std::string(item) + "'");
    }
    cells.push_back(value);

    if (comma == std::string_view::npos) break;
    text.remove_prefix(comma + 1);
  }
  return model::NormalizeCells(std::move(cells));
}

} // namespace airspace::db::sql
