/**
 * @file path_builder.cpp
 * @brief 닫힌 간선 경로 생성 구현
 */

#include "facemask/path_builder.h"

#include <map>
#include <set>

#include "logging.h"

namespace facemask {

namespace {
    /// 닫힌 목록의 최소 길이 (고유 정점 3개 + 닫는 정점)
    constexpr size_t MIN_CLOSED_LIST_SIZE = 4;

    /// 닫힌 다각형의 최소 고유 정점 수
    constexpr size_t MIN_DISTINCT_VERTICES = 3;
}

ErrorCode buildEdgePath(const std::vector<int>& indices,
                        std::vector<LandmarkEdge>& out_path) {
    out_path.clear();
    auto logger = detail::getLogger("facemask.regions");

    if (indices.size() < MIN_CLOSED_LIST_SIZE) {
        logger->error("region definition too short: {} indices", indices.size());
        return ErrorCode::MalformedRegionDefinition;
    }

    if (indices.front() != indices.back()) {
        logger->error("region definition is not closed: first {} != last {}",
                      indices.front(), indices.back());
        return ErrorCode::MalformedRegionDefinition;
    }

    std::set<int> distinct;
    for (int index : indices) {
        if (index < 0) {
            logger->error("negative landmark index {} in region definition", index);
            return ErrorCode::MalformedRegionDefinition;
        }
        distinct.insert(index);
    }
    if (distinct.size() < MIN_DISTINCT_VERTICES) {
        logger->error("region definition has {} distinct vertices", distinct.size());
        return ErrorCode::MalformedRegionDefinition;
    }

    // 후보 간선 목록
    std::vector<LandmarkEdge> candidates;
    candidates.reserve(indices.size() - 1);
    for (size_t i = 0; i + 1 < indices.size(); ++i) {
        candidates.push_back({indices[i], indices[i + 1]});
    }

    // 한 정점에서 나가는 간선은 하나뿐이어야 경로가 결정됨
    std::map<int, size_t> edge_by_from;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!edge_by_from.emplace(candidates[i].from, i).second) {
            logger->error("landmark {} starts more than one edge in region definition",
                          candidates[i].from);
            return ErrorCode::MalformedRegionDefinition;
        }
    }

    std::vector<LandmarkEdge> path;
    path.reserve(candidates.size());
    std::vector<bool> used(candidates.size(), false);

    int current_to = candidates.front().to;
    for (size_t step = 0; step < candidates.size(); ++step) {
        const auto it = edge_by_from.find(current_to);
        if (it == edge_by_from.end() || used[it->second]) {
            logger->error("no unused edge continues the path from landmark {}", current_to);
            return ErrorCode::MalformedRegionDefinition;
        }

        used[it->second] = true;
        const LandmarkEdge& next = candidates[it->second];
        path.push_back(next);
        current_to = next.to;
    }

    if (!isClosedPath(path)) {
        logger->error("region definition does not form a single closed loop");
        return ErrorCode::MalformedRegionDefinition;
    }

    out_path = std::move(path);
    return ErrorCode::Success;
}

bool isClosedPath(const std::vector<LandmarkEdge>& path) {
    if (path.empty()) {
        return false;
    }

    for (size_t i = 0; i + 1 < path.size(); ++i) {
        if (path[i].to != path[i + 1].from) {
            return false;
        }
    }
    return path.back().to == path.front().from;
}

} // namespace facemask
