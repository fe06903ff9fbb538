#include "Timestamp/Timestamp.hpp"

#include <chrono>
#include <cstdio>
#include <tuple>

namespace
{
constexpr std::size_t TimestampTextLength = 16;
constexpr std::size_t TimestampBufferSize = 32;
constexpr long long MinutesPerHour = 60;
constexpr long long MinutesPerDay = 24 * MinutesPerHour;

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian civil date.
 */
long long DaysFromCivil(long long year, unsigned month, unsigned day)
{
    year -= (month <= 2) ? 1 : 0;
    const long long era = ((year >= 0) ? year : (year - 399)) / 400;
    const unsigned yearOfEra = static_cast<unsigned>(year - era * 400);
    const unsigned dayOfYear = (153 * (month + ((month > 2) ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned dayOfEra = yearOfEra * 365 + yearOfEra / 4 - yearOfEra / 100 + dayOfYear;
    return era * 146097 + static_cast<long long>(dayOfEra) - 719468;
}

/**
 * @brief Civil date for a number of days since 1970-01-01.
 */
void CivilFromDays(long long days, int& year, int& month, int& day)
{
    days += 719468;
    const long long era = ((days >= 0) ? days : (days - 146096)) / 146097;
    const unsigned dayOfEra = static_cast<unsigned>(days - era * 146097);
    const unsigned yearOfEra = (dayOfEra - dayOfEra / 1460 + dayOfEra / 36524 - dayOfEra / 146096) / 365;
    const unsigned dayOfYear = dayOfEra - (365 * yearOfEra + yearOfEra / 4 - yearOfEra / 100);
    const unsigned monthIndex = (5 * dayOfYear + 2) / 153;

    day = static_cast<int>(dayOfYear - (153 * monthIndex + 2) / 5 + 1);
    month = static_cast<int>((monthIndex < 10) ? (monthIndex + 3) : (monthIndex - 9));
    year = static_cast<int>(static_cast<long long>(yearOfEra) + era * 400 + ((month <= 2) ? 1 : 0));
}

bool IsLeapYear(int year)
{
    return ((0 == year % 4) && (0 != year % 100)) || (0 == year % 400);
}

int DaysInMonth(int year, int month)
{
    static const int DaysPerMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if ((2 == month) && (true == IsLeapYear(year)))
    {
        return 29;
    }
    return DaysPerMonth[month - 1];
}

/**
 * @brief Read a fixed-width unsigned decimal field.
 */
bool ReadField(const std::string& text, std::size_t offset, std::size_t width, int& outputValue)
{
    int value = 0;
    for (std::size_t i = offset; i < offset + width; ++i)
    {
        const char character = text[i];
        if ((character < '0') || (character > '9'))
        {
            return false;
        }
        value = value * 10 + (character - '0');
    }
    outputValue = value;
    return true;
}
} // namespace

Timestamp::Timestamp() : Timestamp(1970, 1, 1, 0, 0)
{
}

Timestamp::Timestamp(int year, int month, int day, int hour, int minute)
    : _year(year), _month(month), _day(day), _hour(hour), _minute(minute)
{
}

Timestamp Timestamp::Now()
{
    return FromTime(std::time(nullptr));
}

std::optional<Timestamp> Timestamp::Parse(const std::string& text)
{
    if (TimestampTextLength != text.size())
    {
        return std::nullopt;
    }

    if (('-' != text[4]) || ('-' != text[7]) || ('_' != text[10]) || ('.' != text[13]))
    {
        return std::nullopt;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    if ((false == ReadField(text, 0, 4, year)) || (false == ReadField(text, 5, 2, month)) || (false == ReadField(text, 8, 2, day))
        || (false == ReadField(text, 11, 2, hour)) || (false == ReadField(text, 14, 2, minute)))
    {
        return std::nullopt;
    }

    if ((month < 1) || (month > 12) || (day < 1) || (day > DaysInMonth(year, month)) || (hour > 23) || (minute > 59))
    {
        return std::nullopt;
    }

    return Timestamp(year, month, day, hour, minute);
}

bool Timestamp::IsValid(const std::string& text)
{
    return Parse(text).has_value();
}

Timestamp Timestamp::FromTime(std::time_t time)
{
    std::tm timeStruct{};

#ifdef _WIN32
    _localtime64_s(&timeStruct, &time);
#else
    localtime_r(&time, &timeStruct);
#endif

    return FromTm(timeStruct);
}

Timestamp Timestamp::FromFileTime(fs::file_time_type fileTime)
{
    const auto systemTime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        fileTime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return FromTime(std::chrono::system_clock::to_time_t(systemTime));
}

Timestamp Timestamp::Next() const
{
    return AddMinutes(1);
}

Timestamp Timestamp::AddMinutes(long long minutes) const
{
    return FromMinutes(ToMinutes() + minutes);
}

std::string Timestamp::ToString() const
{
    char buffer[TimestampBufferSize];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d_%02d.%02d", _year, _month, _day, _hour, _minute);
    return buffer;
}

bool Timestamp::operator==(const Timestamp& other) const
{
    return std::tie(_year, _month, _day, _hour, _minute) == std::tie(other._year, other._month, other._day, other._hour, other._minute);
}

bool Timestamp::operator!=(const Timestamp& other) const
{
    return false == (*this == other);
}

bool Timestamp::operator<(const Timestamp& other) const
{
    return std::tie(_year, _month, _day, _hour, _minute) < std::tie(other._year, other._month, other._day, other._hour, other._minute);
}

bool Timestamp::operator<=(const Timestamp& other) const
{
    return false == (other < *this);
}

bool Timestamp::operator>(const Timestamp& other) const
{
    return other < *this;
}

bool Timestamp::operator>=(const Timestamp& other) const
{
    return false == (*this < other);
}

Timestamp Timestamp::FromTm(const std::tm& timeStruct)
{
    return Timestamp(timeStruct.tm_year + 1900, timeStruct.tm_mon + 1, timeStruct.tm_mday, timeStruct.tm_hour, timeStruct.tm_min);
}

Timestamp Timestamp::FromMinutes(long long minutes)
{
    long long days = minutes / MinutesPerDay;
    long long minuteOfDay = minutes % MinutesPerDay;
    if (minuteOfDay < 0)
    {
        minuteOfDay += MinutesPerDay;
        --days;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    CivilFromDays(days, year, month, day);
    return Timestamp(year, month, day, static_cast<int>(minuteOfDay / MinutesPerHour), static_cast<int>(minuteOfDay % MinutesPerHour));
}

long long Timestamp::ToMinutes() const
{
    const long long days = DaysFromCivil(_year, static_cast<unsigned>(_month), static_cast<unsigned>(_day));
    return days * MinutesPerDay + _hour * MinutesPerHour + _minute;
}
