#include "fundamentals/iso_time.hpp"

#include <algorithm>
#include <charconv>
#include <format>

namespace iso_time
{

namespace
{

template<std::integral Ty>
bool read_fixed(std::string_view& text, size_t digits, Ty& out)
{
    // from_chars takes a leading '-'; fields are unsigned digits only.
    auto is_digit = [](char c) { return c >= '0' && c <= '9'; };
    if (text.size() < digits || !std::all_of(text.begin(), text.begin() + digits, is_digit))
    {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + digits, out);
    if (ec != std::errc{} || ptr != text.data() + digits)
    {
        return false;
    }
    text.remove_prefix(digits);
    return true;
}

bool expect(std::string_view& text, char c)
{
    if (text.empty() || text.front() != c)
    {
        return false;
    }
    text.remove_prefix(1);
    return true;
}

std::string render(std::chrono::sys_time<std::chrono::milliseconds> ms_tp)
{
    using namespace std::chrono;
    auto day = floor<days>(ms_tp);
    year_month_day ymd{day};
    hh_mm_ss hms{ms_tp - day};
    return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count(),
                       hms.subseconds().count());
}

} // namespace

std::string format(time_point tp)
{
    return render(std::chrono::floor<std::chrono::milliseconds>(tp));
}

std::string format_deadline(time_point tp)
{
    return render(std::chrono::ceil<std::chrono::milliseconds>(tp));
}

std::optional<time_point> parse(std::string_view text)
{
    using namespace std::chrono;
    int y = 0;
    unsigned mo = 0, d = 0;
    int h = 0, mi = 0, s = 0, ms = 0;

    if (!read_fixed(text, 4, y) || !expect(text, '-') ||
        !read_fixed(text, 2, mo) || !expect(text, '-') ||
        !read_fixed(text, 2, d) || !expect(text, 'T') ||
        !read_fixed(text, 2, h) || !expect(text, ':') ||
        !read_fixed(text, 2, mi) || !expect(text, ':') ||
        !read_fixed(text, 2, s))
    {
        return std::nullopt;
    }
    if (!text.empty() && text.front() == '.')
    {
        text.remove_prefix(1);
        if (!read_fixed(text, 3, ms))
        {
            return std::nullopt;
        }
    }
    if (!expect(text, 'Z') || !text.empty())
    {
        return std::nullopt;
    }

    year_month_day ymd{year{y}, month{mo}, day{d}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 60)
    {
        return std::nullopt;
    }
    return time_point{sys_days{ymd} + hours{h} + minutes{mi} + seconds{s} + milliseconds{ms}};
}

} // namespace iso_time
