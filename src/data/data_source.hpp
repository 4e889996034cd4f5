#pragma once
/// @file data_source.hpp
/// @brief Round-robin provider of CSV rows for data-driven scenarios.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace loadcurve {

/// @brief One data row: column name → value.
using DataRow = std::unordered_map<std::string, std::string>;

enum class DataSourceErrorKind : std::uint8_t {
  Io,              ///< File could not be opened or read.
  NoHeaders,       ///< Input is empty or the header row has no columns.
  EmptyData,       ///< Header present but zero data rows.
  UnterminatedQuote,
};

struct DataSourceError {
  DataSourceErrorKind kind;
  std::size_t line = 0; ///< 1-based input line, 0 when not applicable.
  std::string message;
};

/// @brief Split CSV text into records of fields.
///
/// Comma-delimited, `"` quoting with `""` as an escaped quote, LF or CRLF
/// record separators, embedded newlines allowed inside quotes. Blank lines
/// are skipped.
[[nodiscard]] auto parse_csv(std::string_view text)
    -> std::expected<std::vector<std::vector<std::string>>, DataSourceError>;

/// @brief Immutable table of rows plus a shared atomic cursor.
///
/// next_row() is safe for any number of concurrent callers and returns
/// `rows[cursor.fetch_add(1) % rows.size()]`. reset() is not synchronized
/// with in-flight next_row() calls.
class DataSource {
public:
  /// @brief Build from CSV text whose first record is the header row.
  [[nodiscard]] static auto from_string(std::string_view csv)
      -> std::expected<DataSource, DataSourceError>;

  /// @brief Load a CSV file.
  [[nodiscard]] static auto from_file(const std::filesystem::path &path)
      -> std::expected<DataSource, DataSourceError>;

  DataSource(DataSource &&other) noexcept;
  DataSource &operator=(DataSource &&other) noexcept;
  DataSource(const DataSource &) = delete;
  DataSource &operator=(const DataSource &) = delete;

  /// @brief Next row in round-robin order.
  [[nodiscard]] auto next_row() const noexcept -> const DataRow &;

  /// @brief Rewind the cursor to the first row.
  void reset() noexcept;

  [[nodiscard]] auto headers() const noexcept
      -> const std::vector<std::string> &;
  [[nodiscard]] auto row_count() const noexcept -> std::size_t;
  [[nodiscard]] auto row(std::size_t index) const -> const DataRow &;

private:
  DataSource(std::vector<std::string> headers, std::vector<DataRow> rows);

  std::vector<std::string> headers_;
  std::vector<DataRow> rows_;
  mutable std::atomic<std::size_t> cursor_{0};
};

} // namespace loadcurve
