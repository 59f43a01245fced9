#include "leaguesched/core/league/LeagueTypes.h"

#include <algorithm>
#include <cctype>

namespace leaguesched::core::league {

namespace {

std::string NormalizeTag(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch)) || ch == '-') {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
        }
    }
    return out;
}

}  // namespace

std::string ToString(DivisionType type) {
    switch (type) {
        case DivisionType::kPremier:
            return "PREMIER";
        case DivisionType::kClassic:
            return "CLASSIC";
        case DivisionType::kEcsFc:
            return "ECS_FC";
        case DivisionType::kOther:
            break;
    }
    return "OTHER";
}

std::string ToString(WeekType type) {
    switch (type) {
        case WeekType::kRegular:
            return "REGULAR";
        case WeekType::kPlayoff:
            return "PLAYOFF";
        case WeekType::kMixed:
            return "MIXED";
        case WeekType::kPractice:
            return "PRACTICE";
        case WeekType::kFun:
            return "FUN";
        case WeekType::kTst:
            return "TST";
        case WeekType::kBye:
            return "BYE";
        case WeekType::kBonus:
            return "BONUS";
        case WeekType::kUnknown:
            break;
    }
    return "UNKNOWN";
}

DivisionType ParseDivisionType(const std::string& text) {
    const std::string tag = NormalizeTag(text);
    if (tag == "PREMIER") {
        return DivisionType::kPremier;
    }
    if (tag == "CLASSIC") {
        return DivisionType::kClassic;
    }
    if (tag == "ECS_FC" || tag == "ECSFC") {
        return DivisionType::kEcsFc;
    }
    return DivisionType::kOther;
}

WeekType ParseWeekType(const std::string& text) {
    static const WeekType kAll[] = {
        WeekType::kRegular, WeekType::kPlayoff, WeekType::kMixed, WeekType::kPractice,
        WeekType::kFun,     WeekType::kTst,     WeekType::kBye,   WeekType::kBonus,
    };
    const std::string tag = NormalizeTag(text);
    const auto it = std::find_if(std::begin(kAll), std::end(kAll), [&](WeekType type) {
        return ToString(type) == tag;
    });
    return it == std::end(kAll) ? WeekType::kUnknown : *it;
}

}  // namespace leaguesched::core::league
