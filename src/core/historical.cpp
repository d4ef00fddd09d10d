/**
 * @file historical.cpp
 */

#include "historical.hpp"
#include "scoring.hpp"
#include "time_format.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace surfcast::core {

namespace {

const MonthlyAverage& monthAverage(unsigned month, const HistoryTable& table) {
    if (month < 1 || month > 12) {
        throw std::out_of_range("Номер месяца вне диапазона 1–12: " + std::to_string(month));
    }
    return table[month - 1];
}

} // anonymous namespace

int historicalPercentile(int score, unsigned month, const HistoryTable& table) {
    const auto& avg = monthAverage(month, table);
    const double z = (score - avg.avg_score) / kHistoricalStdDev;
    const double raw = 50.0 * (1.0 + std::tanh(kPercentileScale * z));
    return std::clamp(roundScore(raw), 1, 99);
}

std::string percentileContext(int percentile, unsigned month) {
    const std::string name = monthFullName(month);

    if (percentile >= 90) return "Top 10% day for " + name + "!";
    if (percentile >= 75) return "Better than " + std::to_string(percentile) + "% of " + name + " days";
    if (percentile >= 50) return "Above average for " + name;
    if (percentile >= 25) return "Typical " + name + " conditions";
    return "Below average for " + name;
}

HistoricalComparison compareWithHistory(int score, unsigned month, const HistoryTable& table) {
    HistoricalComparison result;
    result.month_average = monthAverage(month, table);
    result.percentile = historicalPercentile(score, month, table);
    result.context = percentileContext(result.percentile, month);
    return result;
}

} // namespace surfcast::core
