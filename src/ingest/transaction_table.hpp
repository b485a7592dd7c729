// File: src/ingest/transaction_table.hpp
#pragma once

#include "core/types.hpp"
#include <istream>
#include <string>
#include <vector>

namespace profitlift {

/// TransactionTable: Loads a line-item CSV table into transaction records
///
/// One row per line item. Required columns: transaction_id, timestamp,
/// store_id, item_id, price. Optional columns: quantity, margin_pct,
/// category, discount_flag, customer_id_hash, time_bin, weekday_weekend,
/// quarter, festival. Column order is free; header names are matched
/// case-insensitively after trimming.
///
/// Rows are grouped by transaction_id in first-seen order. Context fields
/// missing from the table are derived from the timestamp.
namespace TransactionTable {

    /// Split one CSV record into fields. Handles double-quoted fields with
    /// embedded delimiters and "" escapes; unquoted fields are trimmed.
    /// @param malformed Set to true if a quoted field is left open
    std::vector<std::string> SplitLine(const std::string& line,
                                       char delimiter = ',',
                                       bool* malformed = nullptr);

    /// Parse a whole table from a stream
    /// @throws std::runtime_error naming the row on a missing required column,
    ///         an unparsable value or a malformed record
    std::vector<TransactionRecord> Read(std::istream& in, char delimiter = ',');

    /// Parse a table from a file
    /// @throws std::runtime_error if the file cannot be opened or parsed
    std::vector<TransactionRecord> ReadFile(const std::string& path, char delimiter = ',');

} // namespace TransactionTable

} // namespace profitlift
