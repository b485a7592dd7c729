// File: src/mining/fp_growth.cpp
#include "mining/fp_growth.hpp"
#include <algorithm>
#include <map>
#include <unordered_map>

namespace profitlift {

namespace {

constexpr uint32_t kRootItem = UINT32_MAX;

struct FPNode {
    uint32_t item{kRootItem};
    size_t count{0};
    size_t parent{0};
    // Next node carrying the same item
    size_t next_same_item{SIZE_MAX};
    std::map<uint32_t, size_t> children;
};

/// Prefix tree over encoded items; node 0 is the root
class FPTree {
public:
    FPTree() { nodes_.emplace_back(); }

    void Insert(const std::vector<uint32_t>& path, size_t count) {
        size_t current = 0;
        for (uint32_t item : path) {
            auto it = nodes_[current].children.find(item);
            if (it != nodes_[current].children.end()) {
                current = it->second;
                nodes_[current].count += count;
                continue;
            }

            size_t index = nodes_.size();
            FPNode node;
            node.item = item;
            node.count = count;
            node.parent = current;

            auto head = header_.find(item);
            if (head != header_.end()) {
                node.next_same_item = head->second;
                head->second = index;
            } else {
                header_.emplace(item, index);
            }

            nodes_.push_back(std::move(node));
            nodes_[current].children.emplace(item, index);
            current = index;
        }
    }

    /// Prefix paths (root excluded) leading to every node of `item`
    std::vector<std::pair<std::vector<uint32_t>, size_t>> PrefixPaths(uint32_t item) const {
        std::vector<std::pair<std::vector<uint32_t>, size_t>> paths;
        auto head = header_.find(item);
        if (head == header_.end()) {
            return paths;
        }

        for (size_t index = head->second; index != SIZE_MAX; index = nodes_[index].next_same_item) {
            std::vector<uint32_t> path;
            for (size_t up = nodes_[index].parent; up != 0; up = nodes_[up].parent) {
                path.push_back(nodes_[up].item);
            }
            if (!path.empty()) {
                std::reverse(path.begin(), path.end());
                paths.emplace_back(std::move(path), nodes_[index].count);
            }
        }
        return paths;
    }

private:
    std::vector<FPNode> nodes_;
    std::unordered_map<uint32_t, size_t> header_;
};

} // namespace

FPGrowthMiner::FPGrowthMiner()
    : FPGrowthMiner(Config()) {}

FPGrowthMiner::FPGrowthMiner(const Config& config)
    : config_(config) {}

std::vector<FrequentItemset> FPGrowthMiner::Mine(const std::vector<ItemSet>& baskets,
                                                 double min_support) const {
    ValidateMinSupport(min_support);

    std::vector<FrequentItemset> result;
    if (baskets.empty()) {
        return result;
    }

    const size_t total = baskets.size();
    const size_t min_count = MinSupportCount(min_support, total);

    // Pass 1: item frequencies
    std::map<ItemID, size_t> frequency;
    for (const auto& basket : baskets) {
        for (const auto& item : basket) {
            ++frequency[item];
        }
    }

    // Rank frequent items by descending count, ties by id
    std::vector<std::pair<ItemID, size_t>> ranked;
    for (const auto& [item, count] : frequency) {
        if (count >= min_count) {
            ranked.emplace_back(item, count);
        }
    }
    if (ranked.empty()) {
        return result;
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<ItemID> dictionary;
    std::unordered_map<ItemID, uint32_t> code;
    dictionary.reserve(ranked.size());
    for (const auto& entry : ranked) {
        code.emplace(entry.first, static_cast<uint32_t>(dictionary.size()));
        dictionary.push_back(entry.first);
    }

    // Pass 2: encode each basket as a rank-ordered path
    std::vector<WeightedPath> paths;
    paths.reserve(baskets.size());
    for (const auto& basket : baskets) {
        WeightedPath path;
        path.count = 1;
        for (const auto& item : basket) {
            auto it = code.find(item);
            if (it != code.end()) {
                path.items.push_back(it->second);
            }
        }
        if (!path.items.empty()) {
            std::sort(path.items.begin(), path.items.end());
            paths.push_back(std::move(path));
        }
    }

    std::vector<uint32_t> prefix;
    MineConditional(paths, prefix, min_count, total, dictionary, result);

    SortItemsets(result);
    return result;
}

void FPGrowthMiner::MineConditional(const std::vector<WeightedPath>& paths,
                                    std::vector<uint32_t>& prefix,
                                    size_t min_count,
                                    size_t total,
                                    const std::vector<ItemID>& dictionary,
                                    std::vector<FrequentItemset>& out) const {
    // Item counts within this conditional database
    std::map<uint32_t, size_t> counts;
    for (const auto& path : paths) {
        for (uint32_t item : path.items) {
            counts[item] += path.count;
        }
    }

    FPTree tree;
    for (const auto& path : paths) {
        std::vector<uint32_t> kept;
        kept.reserve(path.items.size());
        for (uint32_t item : path.items) {
            if (counts[item] >= min_count) {
                kept.push_back(item);
            }
        }
        if (!kept.empty()) {
            tree.Insert(kept, path.count);
        }
    }

    // Least frequent items first (highest code)
    for (auto it = counts.rbegin(); it != counts.rend(); ++it) {
        const uint32_t item = it->first;
        const size_t count = it->second;
        if (count < min_count) {
            continue;
        }

        prefix.push_back(item);

        FrequentItemset itemset;
        for (uint32_t code : prefix) {
            itemset.items.insert(dictionary[code]);
        }
        itemset.count = count;
        itemset.support = static_cast<double>(count) / static_cast<double>(total);
        out.push_back(std::move(itemset));

        const bool can_grow = config_.max_itemset_size == 0 ||
                              prefix.size() < config_.max_itemset_size;
        if (can_grow) {
            std::vector<WeightedPath> conditional;
            for (auto& [items, path_count] : tree.PrefixPaths(item)) {
                conditional.push_back(WeightedPath{std::move(items), path_count});
            }
            if (!conditional.empty()) {
                MineConditional(conditional, prefix, min_count, total, dictionary, out);
            }
        }

        prefix.pop_back();
    }
}

} // namespace profitlift
