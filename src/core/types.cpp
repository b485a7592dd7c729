// File: src/core/types.cpp
#include "core/types.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <tuple>
#include <type_traits>

namespace profitlift {

// ============================================================================
// ItemSet helpers
// ============================================================================

size_t ItemSetHash::operator()(const ItemSet& items) const {
    size_t seed = items.size();
    for (const auto& item : items) {
        HashCombine(seed, std::hash<std::string>()(item));
    }
    return seed;
}

std::string JoinItems(const ItemSet& items, const std::string& separator) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& item : items) {
        if (!first) {
            oss << separator;
        }
        oss << item;
        first = false;
    }
    return oss.str();
}

bool ContainsAll(const ItemSet& superset, const ItemSet& subset) {
    // Both sets are ordered, so std::includes runs in linear time
    return std::includes(superset.begin(), superset.end(),
                         subset.begin(), subset.end());
}

bool Intersects(const ItemSet& a, const ItemSet& b) {
    auto it_a = a.begin();
    auto it_b = b.begin();
    while (it_a != a.end() && it_b != b.end()) {
        if (*it_a == *it_b) {
            return true;
        }
        if (*it_a < *it_b) {
            ++it_a;
        } else {
            ++it_b;
        }
    }
    return false;
}

// ============================================================================
// TransactionRecord
// ============================================================================

ItemSet TransactionRecord::Basket() const {
    ItemSet basket;
    for (const auto& line : items) {
        if (!line.item_id.empty()) {
            basket.insert(line.item_id);
        }
    }
    return basket;
}

// ============================================================================
// Context
// ============================================================================

namespace {

std::string TitleCase(const std::string& value) {
    std::string result = value;
    bool start = true;
    for (auto& c : result) {
        if (c == '_' || c == ' ') {
            c = ' ';
            start = true;
        } else if (start) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            start = false;
        }
    }
    return result;
}

auto AsTuple(const Context& c) {
    return std::tie(c.store_id, c.time_bin, c.weekday_weekend, c.quarter, c.festival_period);
}

} // namespace

size_t Context::Dimensionality() const {
    size_t dims = 0;
    if (store_id) ++dims;
    if (time_bin) ++dims;
    if (weekday_weekend) ++dims;
    if (quarter) ++dims;
    if (festival_period) ++dims;
    return dims;
}

bool Context::Matches(const TransactionRecord& record) const {
    if (store_id && *store_id != record.store_id) return false;
    if (time_bin && *time_bin != record.time_bin) return false;
    if (weekday_weekend && *weekday_weekend != record.weekday_weekend) return false;
    if (quarter && *quarter != record.quarter) return false;
    if (festival_period && (!record.festival || *festival_period != *record.festival)) {
        return false;
    }
    return true;
}

std::string Context::ToString() const {
    std::vector<std::string> parts;
    if (store_id) {
        parts.push_back("Store " + *store_id);
    }
    if (festival_period) {
        // Festival takes priority in display
        parts.push_back(TitleCase(*festival_period));
    }
    if (time_bin) {
        parts.push_back(TitleCase(*time_bin));
    }
    if (weekday_weekend) {
        parts.push_back(TitleCase(*weekday_weekend));
    }
    if (quarter && !festival_period) {
        parts.push_back("Q" + std::to_string(*quarter));
    }

    if (parts.empty()) {
        return "Overall";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            oss << " + ";
        }
        oss << parts[i];
    }
    return oss.str();
}

std::string Context::Canonical() const {
    std::ostringstream oss;
    oss << "store=" << store_id.value_or("*")
        << ";time=" << time_bin.value_or("*")
        << ";day=" << weekday_weekend.value_or("*")
        << ";quarter=" << (quarter ? std::to_string(*quarter) : std::string("*"))
        << ";festival=" << festival_period.value_or("*");
    return oss.str();
}

bool Context::operator==(const Context& other) const {
    return AsTuple(*this) == AsTuple(other);
}

bool Context::operator<(const Context& other) const {
    return AsTuple(*this) < AsTuple(other);
}

size_t Context::Hash::operator()(const Context& context) const {
    auto hash_opt = [](const auto& opt) -> size_t {
        using ValueType = typename std::decay_t<decltype(opt)>::value_type;
        return opt ? std::hash<ValueType>()(*opt) + 1 : 0;
    };

    size_t seed = 0;
    HashCombine(seed, hash_opt(context.store_id));
    HashCombine(seed, hash_opt(context.time_bin));
    HashCombine(seed, hash_opt(context.weekday_weekend));
    HashCombine(seed, hash_opt(context.quarter));
    HashCombine(seed, hash_opt(context.festival_period));
    return seed;
}

} // namespace profitlift
