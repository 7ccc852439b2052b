#ifndef CONTRAPTION_BALL_QUERY_HPP
#define CONTRAPTION_BALL_QUERY_HPP

#include <vector>
#include <entt/entt.hpp>

namespace Systems {

/**
 * @brief Active balls sorted by id, i.e. in insertion order.
 *
 * Pairwise passes and snapshots iterate in this order so that results do not
 * depend on the registry's internal storage layout.
 */
std::vector<entt::entity> activeBallsInOrder(const entt::registry& registry);

/** @brief Same as activeBallsInOrder() but including inactive balls. */
std::vector<entt::entity> allBallsInOrder(const entt::registry& registry);

} // namespace Systems

#endif
