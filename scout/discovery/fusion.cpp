#include "fusion.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include <spdlog/spdlog.h>

namespace scout::discovery {

std::vector<Candidate> mergeDuplicates(std::vector<Candidate> candidates) {
    std::vector<Candidate> merged;
    merged.reserve(candidates.size());
    std::map<DedupKey, size_t> positions;

    for (auto& candidate : candidates) {
        auto [it, inserted] =
            positions.try_emplace(candidate.dedupKey(), merged.size());
        if (inserted) {
            merged.push_back(std::move(candidate));
        } else {
            spdlog::debug("fusion: merging duplicate {}",
                          candidate.transport().locator());
            merged[it->second].absorb(candidate);
        }
    }
    return merged;
}

void rankByConfidence(std::vector<Candidate>& candidates) {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return a.confidence() > b.confidence();
                     });
}

std::vector<Candidate> fuse(std::vector<Candidate> candidates) {
    auto merged = mergeDuplicates(std::move(candidates));
    rankByConfidence(merged);
    return merged;
}

}  // namespace scout::discovery
