#include "auth/attempt_counter.hpp"
#include "fundamentals/iso_time.hpp"
#include "fundamentals/json_utils.hpp"
#include "logger.hpp"

namespace json = boost::json;

namespace auth
{

AttemptCounter::AttemptCounter(vault::SecureStore& s, std::string k,
                               const clk::Clock& c, std::chrono::hours window)
    : store(s)
    , key(std::move(k))
    , clock(c)
    , win(window)
{
}

AttemptCount AttemptCounter::current()
{
    auto obj = store.get().get_object(key);
    if (!obj)
    {
        return {};
    }

    AttemptCount out;
    auto count = json_utils::int_or(*obj, "count");
    out.count = count > 0 ? static_cast<uint32_t>(count) : 0;
    if (auto ts = json_utils::str_or(*obj, "reset_at"); !ts.empty())
    {
        out.reset_at = iso_time::parse(ts);
        if (!out.reset_at)
        {
            throw vault::StorageError("Attempt counter '" + key + "' has a malformed reset time");
        }
    }

    if (out.reset_at && clock.get().now() >= *out.reset_at)
    {
        LOG_DEBUG("Attempt counter '{}' window elapsed, clearing {} failures", key, out.count);
        store.get().remove(key);
        return {};
    }
    return out;
}

AttemptCount AttemptCounter::increment()
{
    auto cur = current();
    ++cur.count;
    if (!cur.reset_at)
    {
        cur.reset_at = clock.get().now() + win;
    }

    store.get().set_object(key, json::object{
        {"count", cur.count},
        {"reset_at", iso_time::format_deadline(*cur.reset_at)}
    });
    return cur;
}

void AttemptCounter::reset()
{
    store.get().remove(key);
}

}
