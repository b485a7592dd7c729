// File: src/mining/eclat.cpp
#include "mining/eclat.hpp"
#include <algorithm>
#include <iterator>
#include <map>

namespace profitlift {

EclatMiner::EclatMiner()
    : EclatMiner(Config()) {}

EclatMiner::EclatMiner(const Config& config)
    : config_(config) {}

std::vector<FrequentItemset> EclatMiner::Mine(const std::vector<ItemSet>& baskets,
                                              double min_support) const {
    ValidateMinSupport(min_support);

    std::vector<FrequentItemset> result;
    if (baskets.empty()) {
        return result;
    }

    const size_t total = baskets.size();
    const size_t min_count = MinSupportCount(min_support, total);

    // Vertical layout: item -> ascending basket indices
    std::map<ItemID, TidList> vertical;
    for (size_t tid = 0; tid < baskets.size(); ++tid) {
        for (const auto& item : baskets[tid]) {
            vertical[item].push_back(tid);
        }
    }

    std::vector<Candidate> frequent;
    for (auto& [item, tids] : vertical) {
        if (tids.size() >= min_count) {
            frequent.push_back(Candidate{item, std::move(tids)});
        }
    }

    Extend(ItemSet{}, frequent, min_count, total, result);

    SortItemsets(result);
    return result;
}

void EclatMiner::Extend(const ItemSet& prefix,
                        const std::vector<Candidate>& candidates,
                        size_t min_count,
                        size_t total,
                        std::vector<FrequentItemset>& out) const {
    for (size_t i = 0; i < candidates.size(); ++i) {
        ItemSet items = prefix;
        items.insert(candidates[i].item);

        FrequentItemset itemset;
        itemset.items = items;
        itemset.count = candidates[i].tids.size();
        itemset.support = static_cast<double>(itemset.count) / static_cast<double>(total);
        out.push_back(std::move(itemset));

        if (config_.max_itemset_size != 0 && items.size() >= config_.max_itemset_size) {
            continue;
        }

        std::vector<Candidate> next;
        for (size_t j = i + 1; j < candidates.size(); ++j) {
            TidList common;
            std::set_intersection(candidates[i].tids.begin(), candidates[i].tids.end(),
                                  candidates[j].tids.begin(), candidates[j].tids.end(),
                                  std::back_inserter(common));
            if (common.size() >= min_count) {
                next.push_back(Candidate{candidates[j].item, std::move(common)});
            }
        }

        if (!next.empty()) {
            Extend(items, next, min_count, total, out);
        }
    }
}

} // namespace profitlift
