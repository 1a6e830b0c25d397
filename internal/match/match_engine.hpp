#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/geo/distance_model.hpp"
#include "internal/model/route.hpp"
#include "internal/util/time.hpp"

namespace routebid::match {

/*
  Ranks open packages against a courier route.

  Read-only: takes no locks and writes nothing. Results are recomputed on
  every call and ordered by detour, distance from route, created_at, id.
*/
class MatchEngine {
 public:
  MatchEngine(std::shared_ptr<db::Repository>          repository,
              std::shared_ptr<const geo::DistanceModel> distance,
              std::shared_ptr<const util::Clock>        clock);

  // limit == 0 returns every match.
  std::vector<model::MatchResult> FindMatches(const model::Route& route, std::size_t limit = 0) const;
  std::vector<model::MatchResult> FindMatchesForRoute(const std::string& route_id, std::size_t limit = 0) const;

 private:
  std::shared_ptr<db::Repository>           repository_;
  std::shared_ptr<const geo::DistanceModel> distance_;
  std::shared_ptr<const util::Clock>        clock_;
};

} // namespace routebid::match
