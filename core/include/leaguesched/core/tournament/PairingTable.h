#pragma once

#include <array>

namespace leaguesched::core::tournament {

// Team indices into the ascending-sorted id list of a division.
struct IndexPair {
    int home = 0;
    int away = 0;
};

inline constexpr int kPremierTeamCount = 8;
inline constexpr int kPremierWeekCount = 7;
inline constexpr int kClassicTeamCount = 4;
inline constexpr int kClassicCycleLength = 3;

using PremierWeek = std::array<IndexPair, 8>;
using PremierWeekTable = std::array<PremierWeek, kPremierWeekCount>;
using ClassicWeek = std::array<IndexPair, 4>;
using ClassicRotation = std::array<ClassicWeek, kClassicCycleLength>;

// Double round-robin on 8 teams. Each week lists its matches in slot order:
// entries 0-3 are the early window, 4-7 the late window, two per slot. Every
// pair meets twice, no team meets the same opponent in consecutive weeks, and
// every team gets 7 home, 7 away, 7 first-field and 7 second-field matches
// with a 4/3 early/late window split.
inline constexpr PremierWeekTable kPremierTable = {{
    {{{0, 1}, {2, 3}, {0, 2}, {1, 3}, {4, 5}, {6, 7}, {4, 6}, {5, 7}}},
    {{{0, 4}, {1, 5}, {0, 5}, {1, 4}, {2, 6}, {3, 7}, {2, 7}, {3, 6}}},
    {{{0, 2}, {1, 3}, {0, 3}, {1, 2}, {4, 6}, {5, 7}, {4, 7}, {5, 6}}},
    {{{3, 7}, {2, 6}, {7, 2}, {6, 3}, {1, 5}, {0, 4}, {5, 0}, {4, 1}}},
    {{{7, 1}, {6, 0}, {6, 1}, {7, 0}, {3, 5}, {2, 4}, {3, 4}, {2, 5}}},
    {{{7, 6}, {5, 4}, {6, 5}, {7, 4}, {3, 2}, {1, 0}, {2, 1}, {3, 0}}},
    {{{5, 3}, {4, 2}, {4, 3}, {5, 2}, {7, 1}, {6, 0}, {6, 1}, {7, 0}}},
}};

// Three 4-cycles on 4 teams; any 3 consecutive weeks hold every pair twice
// and give each team 3 home and 3 away matches.
inline constexpr ClassicRotation kClassicRotation = {{
    {{{0, 1}, {2, 3}, {0, 2}, {1, 3}}},
    {{{0, 3}, {1, 2}, {3, 2}, {1, 0}}},
    {{{3, 1}, {2, 0}, {2, 1}, {3, 0}}},
}};

}  // namespace leaguesched::core::tournament
