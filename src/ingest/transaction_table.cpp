// File: src/ingest/transaction_table.cpp
#include "ingest/transaction_table.hpp"
#include "ingest/context_enricher.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <unordered_map>

namespace profitlift {
namespace TransactionTable {

namespace {

std::string Trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string Lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Column positions resolved from the header row
struct ColumnMap {
    std::unordered_map<std::string, size_t> index;

    std::optional<size_t> Find(const std::string& name) const {
        auto it = index.find(name);
        if (it == index.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

std::runtime_error RowError(size_t row, const std::string& message) {
    return std::runtime_error("Transaction table row " + std::to_string(row) + ": " + message);
}

// Value of an optional column, empty when the column is absent or short
std::string Field(const std::vector<std::string>& fields,
                  const std::optional<size_t>& column) {
    if (!column || *column >= fields.size()) {
        return "";
    }
    return fields[*column];
}

double ParseDouble(const std::string& text, const char* column, size_t row) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw RowError(row, std::string("invalid ") + column + " '" + text + "'");
    }
}

long long ParseInteger(const std::string& text, const char* column, size_t row) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw RowError(row, std::string("invalid ") + column + " '" + text + "'");
    }
}

bool ParseFlag(const std::string& text, size_t row) {
    std::string value = Lower(text);
    if (value.empty() || value == "0" || value == "false" || value == "no" || value == "n") {
        return false;
    }
    if (value == "1" || value == "true" || value == "yes" || value == "y") {
        return true;
    }
    throw RowError(row, "invalid discount_flag '" + text + "'");
}

} // namespace

std::vector<std::string> SplitLine(const std::string& line, char delimiter, bool* malformed) {
    if (malformed) {
        *malformed = false;
    }

    std::vector<std::string> fields;
    std::string value;
    bool in_quotes = false;
    bool quoted = false;

    auto push_field = [&]() {
        fields.push_back(quoted ? value : Trim(value));
        value.clear();
        quoted = false;
    };

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    value += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                value += c;
            }
        } else if (c == '"' && Trim(value).empty()) {
            value.clear();
            in_quotes = true;
            quoted = true;
        } else if (c == delimiter) {
            push_field();
        } else if (c != '\r') {
            value += c;
        }
    }

    if (in_quotes && malformed) {
        *malformed = true;
    }
    push_field();
    return fields;
}

std::vector<TransactionRecord> Read(std::istream& in, char delimiter) {
    std::string line;

    // Header, skipping a UTF-8 byte order mark
    if (!std::getline(in, line)) {
        throw std::runtime_error("Transaction table is empty (no header row)");
    }
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }

    ColumnMap columns;
    std::vector<std::string> header = SplitLine(line, delimiter);
    for (size_t i = 0; i < header.size(); ++i) {
        columns.index.emplace(Lower(Trim(header[i])), i);
    }

    static const char* kRequired[] = {"transaction_id", "timestamp", "store_id", "item_id", "price"};
    for (const char* name : kRequired) {
        if (!columns.Find(name)) {
            throw std::runtime_error(std::string("Transaction table is missing required column '") +
                                     name + "'");
        }
    }

    const auto col_txn = columns.Find("transaction_id");
    const auto col_ts = columns.Find("timestamp");
    const auto col_store = columns.Find("store_id");
    const auto col_item = columns.Find("item_id");
    const auto col_price = columns.Find("price");
    const auto col_qty = columns.Find("quantity");
    const auto col_margin = columns.Find("margin_pct");
    const auto col_category = columns.Find("category");
    const auto col_discount = columns.Find("discount_flag");
    const auto col_customer = columns.Find("customer_id_hash");
    const auto col_time_bin = columns.Find("time_bin");
    const auto col_weekday = columns.Find("weekday_weekend");
    const auto col_quarter = columns.Find("quarter");
    const auto col_festival = columns.Find("festival");

    std::vector<TransactionRecord> records;
    std::unordered_map<std::string, size_t> position;

    size_t row = 1;
    while (std::getline(in, line)) {
        ++row;
        if (Trim(line).empty()) {
            continue;
        }

        bool malformed = false;
        std::vector<std::string> fields = SplitLine(line, delimiter, &malformed);
        if (malformed) {
            throw RowError(row, "unterminated quoted field");
        }

        const std::string txn_id = Field(fields, col_txn);
        if (txn_id.empty()) {
            throw RowError(row, "empty transaction_id");
        }
        const std::string timestamp_text = Field(fields, col_ts);
        auto timestamp = ContextEnricher::ParseTimestamp(timestamp_text);
        if (!timestamp) {
            throw RowError(row, "invalid timestamp '" + timestamp_text + "'");
        }

        LineItem item;
        item.item_id = Field(fields, col_item);
        if (item.item_id.empty()) {
            throw RowError(row, "empty item_id");
        }
        item.price = ParseDouble(Field(fields, col_price), "price", row);

        const std::string qty_text = Field(fields, col_qty);
        if (!qty_text.empty()) {
            long long qty = ParseInteger(qty_text, "quantity", row);
            if (qty < 0) {
                throw RowError(row, "negative quantity '" + qty_text + "'");
            }
            item.quantity = static_cast<uint32_t>(qty);
        }
        const std::string margin_text = Field(fields, col_margin);
        if (!margin_text.empty()) {
            item.margin_pct = ParseDouble(margin_text, "margin_pct", row);
        }
        const std::string category = Field(fields, col_category);
        if (!category.empty()) {
            item.category = category;
        }

        auto it = position.find(txn_id);
        if (it == position.end()) {
            TransactionRecord record;
            record.transaction_id = txn_id;
            record.timestamp = *timestamp;
            record.store_id = Field(fields, col_store);
            record.discount_flag = ParseFlag(Field(fields, col_discount), row);

            const std::string customer = Field(fields, col_customer);
            if (!customer.empty()) {
                record.customer_hash = customer;
            }
            record.time_bin = Lower(Field(fields, col_time_bin));
            record.weekday_weekend = Lower(Field(fields, col_weekday));

            const std::string quarter_text = Field(fields, col_quarter);
            if (!quarter_text.empty()) {
                long long quarter = ParseInteger(quarter_text, "quarter", row);
                if (quarter < 1 || quarter > 4) {
                    throw RowError(row, "quarter out of range '" + quarter_text + "'");
                }
                record.quarter = static_cast<int>(quarter);
            }
            const std::string festival = Lower(Field(fields, col_festival));
            if (!festival.empty()) {
                record.festival = festival;
            }

            position.emplace(txn_id, records.size());
            records.push_back(std::move(record));
            it = position.find(txn_id);
        } else if (ParseFlag(Field(fields, col_discount), row)) {
            records[it->second].discount_flag = true;
        }

        records[it->second].items.push_back(std::move(item));
    }

    ContextEnricher::EnrichTransactions(records);
    return records;
}

std::vector<TransactionRecord> ReadFile(const std::string& path, char delimiter) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open transaction table: " + path);
    }
    return Read(file, delimiter);
}

} // namespace TransactionTable
} // namespace profitlift
