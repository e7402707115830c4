#pragma once
#include <atomic>
#include <chrono>
#include <algorithm>
#include <cstdint>
#include <format>
#include <ranges>
#include <string>
#include <vector>

struct AuthMetrics
{
    std::atomic<uint64_t> sign_ins_successful{0};
    std::atomic<uint64_t> sign_ins_failed{0};
    std::atomic<uint64_t> sign_ups{0};
    std::atomic<uint64_t> sign_outs{0};
    std::atomic<uint64_t> biometric_successful{0};
    std::atomic<uint64_t> biometric_failed{0};
    std::atomic<uint64_t> biometric_lockouts{0};
    std::atomic<uint64_t> pin_successful{0};
    std::atomic<uint64_t> pin_failed{0};
    std::atomic<uint64_t> pin_lockouts{0};
    std::atomic<uint64_t> token_refreshes{0};
    std::atomic<uint64_t> app_locks{0};
    std::atomic<uint64_t> app_unlocks{0};
    std::atomic<uint64_t> storage_errors{0};

    std::chrono::steady_clock::time_point start_time{std::chrono::steady_clock::now()};

    AuthMetrics() = default;
};

template<>
struct std::formatter<AuthMetrics>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const AuthMetrics& s, std::format_context& fc) const
    {
        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - s.start_time).count();

        uint64_t in_ok = s.sign_ins_successful.load();
        uint64_t in_fail = s.sign_ins_failed.load();
        uint64_t bio_ok = s.biometric_successful.load();
        uint64_t bio_fail = s.biometric_failed.load();
        uint64_t pin_ok = s.pin_successful.load();
        uint64_t pin_fail = s.pin_failed.load();

        auto rate = [](uint64_t ok, uint64_t bad)
        {
            return ok + bad > 0 ? ok * 100.0 / static_cast<double>(ok + bad) : 0.0;
        };

        std::vector<std::string> lines;

        lines.push_back(std::format(""));
        lines.push_back(std::format("============================================================"));
        lines.push_back(std::format("AUTH METRICS REPORT"));
        lines.push_back(std::format("============================================================"));
        lines.push_back(std::format("Uptime: {}s ({:.2f}h)", uptime, uptime / 3600.0));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- PASSWORD ---"));
        lines.push_back(std::format("  Sign-ins:        {}", in_ok));
        lines.push_back(std::format("  Failed:          {}", in_fail));
        lines.push_back(std::format("  Success Rate:    {:.1f}%", rate(in_ok, in_fail)));
        lines.push_back(std::format("  Sign-ups:        {}", s.sign_ups.load()));
        lines.push_back(std::format("  Sign-outs:       {}", s.sign_outs.load()));
        lines.push_back(std::format("  Refreshes:       {}", s.token_refreshes.load()));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- BIOMETRIC ---"));
        lines.push_back(std::format("  Successful:      {}", bio_ok));
        lines.push_back(std::format("  Failed:          {}", bio_fail));
        lines.push_back(std::format("  Lockouts:        {}", s.biometric_lockouts.load()));
        lines.push_back(std::format("  Success Rate:    {:.1f}%", rate(bio_ok, bio_fail)));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- PIN ---"));
        lines.push_back(std::format("  Successful:      {}", pin_ok));
        lines.push_back(std::format("  Failed:          {}", pin_fail));
        lines.push_back(std::format("  Lockouts:        {}", s.pin_lockouts.load()));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- APP LOCK ---"));
        lines.push_back(std::format("  Locks:           {}", s.app_locks.load()));
        lines.push_back(std::format("  Unlocks:         {}", s.app_unlocks.load()));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- ERRORS ---"));
        lines.push_back(std::format("  Storage:         {}", s.storage_errors.load()));
        lines.push_back(std::format("============================================================"));

        return std::ranges::copy(lines | std::views::join_with('\n'), fc.out()).out;
    }
};
