/// @file data_source.cpp
/// @brief CSV parsing and the round-robin DataSource.

#include "data/data_source.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace loadcurve {

auto parse_csv(std::string_view text)
    -> std::expected<std::vector<std::vector<std::string>>, DataSourceError> {
  std::vector<std::vector<std::string>> records;
  std::vector<std::string> record;
  std::string field;
  bool in_quotes = false;
  bool field_quoted = false;
  std::size_t line = 1;
  std::size_t quote_line = 0;

  auto end_field = [&] {
    record.push_back(std::move(field));
    field.clear();
    field_quoted = false;
  };
  auto end_record = [&] {
    end_field();
    // A lone empty unquoted field is a blank line.
    const bool blank = record.size() == 1 && record.front().empty();
    if (!blank) {
      records.push_back(std::move(record));
    }
    record.clear();
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];

    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        if (c == '\n') {
          ++line;
        }
        field.push_back(c);
      }
      continue;
    }

    switch (c) {
    case '"':
      if (field.empty() && !field_quoted) {
        in_quotes = true;
        field_quoted = true;
        quote_line = line;
      } else {
        field.push_back(c); // Stray quote inside an unquoted field.
      }
      break;
    case ',':
      end_field();
      break;
    case '\r':
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        break; // CRLF: the LF ends the record.
      }
      end_record();
      ++line;
      break;
    case '\n':
      end_record();
      ++line;
      break;
    default:
      field.push_back(c);
      break;
    }
  }

  if (in_quotes) {
    return std::unexpected(DataSourceError{
        .kind = DataSourceErrorKind::UnterminatedQuote,
        .line = quote_line,
        .message = "quoted field is never closed",
    });
  }

  if (!field.empty() || field_quoted || !record.empty()) {
    end_record();
  }

  return records;
}

// ─── DataSource ─────────────────────────────────────────────────────────

DataSource::DataSource(std::vector<std::string> headers,
                       std::vector<DataRow> rows)
    : headers_{std::move(headers)}, rows_{std::move(rows)} {}

DataSource::DataSource(DataSource &&other) noexcept
    : headers_{std::move(other.headers_)}, rows_{std::move(other.rows_)},
      cursor_{other.cursor_.load(std::memory_order_relaxed)} {}

DataSource &DataSource::operator=(DataSource &&other) noexcept {
  if (this != &other) {
    headers_ = std::move(other.headers_);
    rows_ = std::move(other.rows_);
    cursor_.store(other.cursor_.load(std::memory_order_relaxed),
                  std::memory_order_relaxed);
  }
  return *this;
}

auto DataSource::from_string(std::string_view csv)
    -> std::expected<DataSource, DataSourceError> {
  auto parsed = parse_csv(csv);
  if (!parsed.has_value()) {
    return std::unexpected(std::move(parsed.error()));
  }

  auto &records = *parsed;
  if (records.empty() || records.front().empty()) {
    return std::unexpected(DataSourceError{
        .kind = DataSourceErrorKind::NoHeaders,
        .message = "input has no header row",
    });
  }

  auto headers = std::move(records.front());
  for (auto &h : headers) {
    // Tolerate a UTF-8 byte-order mark on the first column.
    if (h.starts_with("\xEF\xBB\xBF")) {
      h.erase(0, 3);
    }
  }

  std::vector<DataRow> rows;
  rows.reserve(records.size() - 1);
  for (std::size_t r = 1; r < records.size(); ++r) {
    DataRow row;
    const auto &rec = records[r];
    for (std::size_t i = 0; i < headers.size() && i < rec.size(); ++i) {
      row.emplace(headers[i], rec[i]);
    }
    rows.push_back(std::move(row));
  }

  if (rows.empty()) {
    return std::unexpected(DataSourceError{
        .kind = DataSourceErrorKind::EmptyData,
        .message = "input has a header row but no data rows",
    });
  }

  return DataSource{std::move(headers), std::move(rows)};
}

auto DataSource::from_file(const std::filesystem::path &path)
    -> std::expected<DataSource, DataSourceError> {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(DataSourceError{
        .kind = DataSourceErrorKind::Io,
        .message = "cannot open " + path.string(),
    });
  }

  std::ostringstream ss;
  ss << file.rdbuf();

  auto result = from_string(ss.str());
  if (result.has_value()) {
    std::cout << "[DataSource] Loaded " << result->row_count() << " rows ("
              << result->headers().size() << " columns) from "
              << path.string() << "\n";
  }
  return result;
}

auto DataSource::next_row() const noexcept -> const DataRow & {
  const auto idx = cursor_.fetch_add(1, std::memory_order_relaxed);
  return rows_[idx % rows_.size()];
}

void DataSource::reset() noexcept {
  cursor_.store(0, std::memory_order_relaxed);
}

auto DataSource::headers() const noexcept -> const std::vector<std::string> & {
  return headers_;
}

auto DataSource::row_count() const noexcept -> std::size_t {
  return rows_.size();
}

auto DataSource::row(std::size_t index) const -> const DataRow & {
  return rows_.at(index);
}

} // namespace loadcurve
