#pragma once

#include "types.hpp"
#include "config.hpp"
#include <optional>
#include <string>
#include <vector>

struct RivalryMatch {
    std::string name;
};

// Known rivalries and derbies per sport, matched on team names in either order
class RivalryTable {
public:
    explicit RivalryTable(const Config& config);

    std::optional<RivalryMatch> find(const BetCandidate& candidate) const;

    std::size_t size() const { return entries_.size(); }

private:
    static bool team_matches(const std::string& listed, const std::string& team);

    std::vector<RivalryEntry> entries_;
};
