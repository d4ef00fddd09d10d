/**
 * @file local_time.cpp
 * @brief Реализация работы с местным временем
 */

#include "local_time.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace surfcast::model {

using namespace std::chrono;

namespace {

/// Чтение ровно count цифр начиная с pos
std::optional<int> readDigits(std::string_view str, size_t pos, size_t count) {
    if (pos + count > str.size()) {
        return std::nullopt;
    }
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if (!std::isdigit(c)) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

} // anonymous namespace

LocalTime makeLocalTime(int y, unsigned m, unsigned d, int hour, int minute, int second) {
    LocalDate date{year{y} / month{m} / day{d}};
    return LocalTime{date} + hours{hour} + minutes{minute} + seconds{second};
}

int hourOf(LocalTime t) noexcept {
    auto since_midnight = t - LocalTime{dateOf(t)};
    return static_cast<int>(duration_cast<hours>(since_midnight).count());
}

int dayOfYear(LocalDate date) noexcept {
    year_month_day ymd{date};
    LocalDate jan1{ymd.year() / January / 1};
    return static_cast<int>((date - jan1).count()) + 1;
}

unsigned monthOf(LocalDate date) noexcept {
    year_month_day ymd{date};
    return static_cast<unsigned>(ymd.month());
}

bool isWeekend(LocalDate date) noexcept {
    weekday wd{date};
    return wd == Saturday || wd == Sunday;
}

std::optional<LocalTime> parseLocalTime(std::string_view str) {
    // Дата: YYYY-MM-DD
    auto y = readDigits(str, 0, 4);
    auto mo = readDigits(str, 5, 2);
    auto d = readDigits(str, 8, 2);
    if (!y || !mo || !d || str.size() < 10 || str[4] != '-' || str[7] != '-') {
        return std::nullopt;
    }

    year_month_day ymd{year{*y}, month{static_cast<unsigned>(*mo)}, day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }

    if (str.size() == 10) {
        return LocalTime{LocalDate{ymd}};
    }

    // Время: HH:MM[:SS]
    if (str[10] != 'T' && str[10] != ' ') {
        return std::nullopt;
    }
    auto h = readDigits(str, 11, 2);
    auto mi = readDigits(str, 14, 2);
    if (!h || !mi || str.size() < 16 || str[13] != ':' || *h > 23 || *mi > 59) {
        return std::nullopt;
    }

    int s = 0;
    if (str.size() > 16) {
        auto sec = readDigits(str, 17, 2);
        if (str[16] != ':' || !sec || *sec > 59 || str.size() != 19) {
            return std::nullopt;
        }
        s = *sec;
    }

    return LocalTime{LocalDate{ymd}} + hours{*h} + minutes{*mi} + seconds{s};
}

std::string formatIsoLocal(LocalTime t) {
    year_month_day ymd{dateOf(t)};
    hh_mm_ss hms{t - LocalTime{dateOf(t)}};

    std::ostringstream ss;
    ss << static_cast<int>(ymd.year()) << "-"
       << std::setfill('0') << std::setw(2) << static_cast<unsigned>(ymd.month()) << "-"
       << std::setw(2) << static_cast<unsigned>(ymd.day()) << "T"
       << std::setw(2) << hms.hours().count() << ":"
       << std::setw(2) << hms.minutes().count() << ":"
       << std::setw(2) << hms.seconds().count();
    return ss.str();
}

} // namespace surfcast::model
