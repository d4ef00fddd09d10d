/**
 * @file types.cpp
 * @brief Преобразования перечислений в строки и обратно
 */

#include "types.hpp"
#include <algorithm>
#include <cctype>

namespace surfcast::model {

namespace {

std::string lowered(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // anonymous namespace

std::string toString(BoardType board) {
    switch (board) {
        case BoardType::Longboard: return "longboard";
        case BoardType::Mediumboard: return "mediumboard";
        case BoardType::Shortboard: return "shortboard";
    }
    return "mediumboard";
}

std::string toString(SkillLevel skill) {
    switch (skill) {
        case SkillLevel::Beginner: return "beginner";
        case SkillLevel::Advanced: return "advanced";
        case SkillLevel::Expert: return "expert";
    }
    return "advanced";
}

std::string toString(TidePreference preference) {
    switch (preference) {
        case TidePreference::Low: return "low";
        case TidePreference::Mid: return "mid";
        case TidePreference::High: return "high";
        case TidePreference::Any: return "any";
    }
    return "any";
}

std::string toString(TidePhase phase) {
    switch (phase) {
        case TidePhase::Rising: return "rising";
        case TidePhase::Falling: return "falling";
        case TidePhase::High: return "high";
        case TidePhase::Low: return "low";
    }
    return "rising";
}

std::string toString(Rating rating) {
    switch (rating) {
        case Rating::Poor: return "Poor";
        case Rating::Fair: return "Fair";
        case Rating::Good: return "Good";
        case Rating::Excellent: return "Excellent";
    }
    return "Poor";
}

std::string toString(TideEventType type) {
    return type == TideEventType::High ? "H" : "L";
}

std::optional<BoardType> parseBoardType(std::string_view str) {
    auto s = lowered(str);
    if (s == "longboard") return BoardType::Longboard;
    if (s == "mediumboard" || s == "midlength" || s == "mid-length") return BoardType::Mediumboard;
    if (s == "shortboard") return BoardType::Shortboard;
    return std::nullopt;
}

std::optional<SkillLevel> parseSkillLevel(std::string_view str) {
    auto s = lowered(str);
    if (s == "beginner") return SkillLevel::Beginner;
    if (s == "advanced" || s == "intermediate") return SkillLevel::Advanced;
    if (s == "expert") return SkillLevel::Expert;
    return std::nullopt;
}

std::optional<TidePreference> parseTidePreference(std::string_view str) {
    auto s = lowered(str);
    if (s == "low") return TidePreference::Low;
    if (s == "mid") return TidePreference::Mid;
    if (s == "high") return TidePreference::High;
    if (s == "any") return TidePreference::Any;
    return std::nullopt;
}

std::optional<TidePhase> parseTidePhase(std::string_view str) {
    auto s = lowered(str);
    if (s == "rising") return TidePhase::Rising;
    if (s == "falling") return TidePhase::Falling;
    if (s == "high") return TidePhase::High;
    if (s == "low") return TidePhase::Low;
    return std::nullopt;
}

std::optional<TideEventType> parseTideEventType(std::string_view str) {
    auto s = lowered(str);
    if (s == "h" || s == "high") return TideEventType::High;
    if (s == "l" || s == "low") return TideEventType::Low;
    return std::nullopt;
}

} // namespace surfcast::model
