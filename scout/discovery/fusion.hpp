#ifndef SCOUT_DISCOVERY_FUSION_HPP
#define SCOUT_DISCOVERY_FUSION_HPP

#include <vector>

#include "candidate.hpp"

namespace scout::discovery {

/**
 * @brief Merge candidates sharing a dedup key.
 *
 * Groups keep the position of their first member. A merged candidate holds
 * the highest confidence of its group, the first present value of each
 * optional field and every member's notes in order.
 */
[[nodiscard]] std::vector<Candidate> mergeDuplicates(
    std::vector<Candidate> candidates);

/**
 * @brief Stable sort by confidence, highest first.
 */
void rankByConfidence(std::vector<Candidate>& candidates);

/**
 * @brief mergeDuplicates() followed by rankByConfidence().
 */
[[nodiscard]] std::vector<Candidate> fuse(std::vector<Candidate> candidates);

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_FUSION_HPP
