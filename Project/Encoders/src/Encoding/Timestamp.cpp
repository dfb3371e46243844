#include "pch.h"
#include "Encoding/Timestamp.hpp"
#include "Encoding/JsonValueObjectEncoderContext.hpp"

namespace Encoders {

std::string FormatTimestamp(const std::chrono::sys_time<std::chrono::milliseconds>& time)
{
    using namespace std::chrono;

    const auto day = floor<days>(time);
    const year_month_day date{ day };
    const hh_mm_ss<milliseconds> clock{ time - day };

    const int y = static_cast<int>(date.year());
    if (y < 0 || y > 9999)
        throw EncodingException("Timestamp year " + std::to_string(y) + " is outside 0000-9999");

    std::ostringstream ss;
    ss << std::setfill('0')
        << std::setw(4) << y << '-'
        << std::setw(2) << static_cast<unsigned>(date.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(date.day()) << 'T'
        << std::setw(2) << clock.hours().count() << ':'
        << std::setw(2) << clock.minutes().count() << ':'
        << std::setw(2) << clock.seconds().count() << '.'
        << std::setw(3) << clock.subseconds().count() << 'Z';
    return ss.str();
}

std::string FormatTimestamp(const std::chrono::system_clock::time_point& time)
{
    return FormatTimestamp(std::chrono::floor<std::chrono::milliseconds>(time));
}

void EncodeTimestamp(const std::chrono::system_clock::time_point& time, ValueEncoderContext& context)
{
    context.Add(FormatTimestamp(time));
}

}
