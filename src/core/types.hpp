// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace profitlift {

// ItemID: Product identifier as supplied by the ingestion layer
using ItemID = std::string;

// ItemSet: Ordered set of distinct item ids
// Ordered storage keeps iteration (and therefore signatures) deterministic
using ItemSet = std::set<ItemID>;

// Hash support for ItemSet keys
struct ItemSetHash {
    size_t operator()(const ItemSet& items) const;
};

// Join items with a separator in set order ("a,b,c")
std::string JoinItems(const ItemSet& items, const std::string& separator = ",");

// True if every item of `subset` is contained in `superset`
bool ContainsAll(const ItemSet& superset, const ItemSet& subset);

// True if the two sets share at least one item
bool Intersects(const ItemSet& a, const ItemSet& b);

// LineItem: One product line of a transaction
struct LineItem {
    ItemID item_id;
    uint32_t quantity{1};
    double price{0.0};

    /// Margin fraction of the unit price (0.0 to 1.0), if known
    std::optional<double> margin_pct;

    /// Product category, used for category-level margin defaults
    std::optional<std::string> category;
};

// TransactionRecord: A validated, context-enriched basket
//
// Owned and enriched by the ingestion layer; the mining core only reads it.
struct TransactionRecord {
    std::string transaction_id;

    /// Unix seconds (UTC)
    int64_t timestamp{0};

    std::string store_id;
    std::vector<LineItem> items;
    std::optional<std::string> customer_hash;
    bool discount_flag{false};

    // Derived context fields
    std::string time_bin;
    std::string weekday_weekend;
    int quarter{0};
    std::optional<std::string> festival;

    /// Distinct item ids of this transaction
    ItemSet Basket() const;

    /// Number of line items
    size_t BasketSize() const { return items.size(); }
};

// Context: Constraint tuple used to partition transactions before mining
//
// An absent field means "unconstrained". Supports structural equality,
// ordering and hashing so it can serve as a map key.
struct Context {
    std::optional<std::string> store_id;
    std::optional<std::string> time_bin;
    std::optional<std::string> weekday_weekend;
    std::optional<int> quarter;
    std::optional<std::string> festival_period;

    /// The unconstrained context
    static Context Overall() { return Context{}; }

    /// True if no field is constrained
    bool IsOverall() const { return Dimensionality() == 0; }

    /// Number of constrained fields
    size_t Dimensionality() const;

    /// True if every constrained field equals the record's value
    bool Matches(const TransactionRecord& record) const;

    /// Human-readable label, e.g. "Store S1 + Morning" or "Overall"
    std::string ToString() const;

    /// Canonical key form, stable across runs ("store=S1;time=morning")
    std::string Canonical() const;

    bool operator==(const Context& other) const;
    bool operator!=(const Context& other) const { return !(*this == other); }
    bool operator<(const Context& other) const;

    struct Hash {
        size_t operator()(const Context& context) const;
    };
};

// Combine a value's hash into a running seed (boost::hash_combine recipe)
inline void HashCombine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace profitlift
