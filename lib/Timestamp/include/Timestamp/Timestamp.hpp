#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Minute-resolution local point in time identifying a snapshot.
 *
 * Canonical text form is YYYY-MM-DD_HH.MM. Fields are kept broken down so the
 * arithmetic does not depend on the time zone or daylight saving rules.
 */
class Timestamp
{
  public:
    /**
     * @brief Construct the epoch timestamp 1970-01-01_00.00.
     */
    Timestamp();

    /**
     * @brief Current local time truncated to the minute.
     *
     * @return Timestamp for now
     */
    static Timestamp Now();

    /**
     * @brief Parse a timestamp from its canonical text form.
     *
     * Fixed field widths, zero padding and the '-', '_', '.' separators are
     * required. Field values must form a valid calendar date and time.
     *
     * @param[in] text Text to parse
     * @return Parsed timestamp, or empty optional if the text is not canonical
     */
    static std::optional<Timestamp> Parse(const std::string& text);

    /**
     * @brief Check whether a string is a canonical timestamp.
     *
     * @param[in] text Text to check
     * @return true if Parse() would succeed
     */
    static bool IsValid(const std::string& text);

    /**
     * @brief Convert calendar time to local time truncated to the minute.
     *
     * @param[in] time Seconds since the epoch
     * @return Timestamp for the given time
     */
    static Timestamp FromTime(std::time_t time);

    /**
     * @brief Convert a filesystem time to local time truncated to the minute.
     *
     * @param[in] fileTime Modification or creation time of a filesystem entry
     * @return Timestamp for the given time
     */
    static Timestamp FromFileTime(fs::file_time_type fileTime);

    /**
     * @brief Timestamp exactly one minute later.
     *
     * The name format holds four-digit years only, so the successor of
     * 9999-12-31_23.59 is a timestamp that IsValid rejects once formatted.
     */
    Timestamp Next() const;

    /**
     * @brief Timestamp shifted by a number of minutes (negative goes back).
     *
     * @param[in] minutes Minutes to add
     * @return Shifted timestamp
     */
    Timestamp AddMinutes(long long minutes) const;

    /**
     * @brief Format as YYYY-MM-DD_HH.MM.
     */
    std::string ToString() const;

    int Year() const { return _year; }
    int Month() const { return _month; }
    int Day() const { return _day; }
    int Hour() const { return _hour; }
    int Minute() const { return _minute; }

    bool operator==(const Timestamp& other) const;
    bool operator!=(const Timestamp& other) const;
    bool operator<(const Timestamp& other) const;
    bool operator<=(const Timestamp& other) const;
    bool operator>(const Timestamp& other) const;
    bool operator>=(const Timestamp& other) const;

  private:
    Timestamp(int year, int month, int day, int hour, int minute);

    static Timestamp FromTm(const std::tm& timeStruct);
    static Timestamp FromMinutes(long long minutes);
    long long ToMinutes() const;

    int _year;
    int _month;
    int _day;
    int _hour;
    int _minute;
};
