#pragma once

#include <type_traits>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#ifdef _DEBUG
#define LOG(FMT, ...) std::fprintf(stderr, FMT __VA_OPT__(,) __VA_ARGS__)
#define HIGHLIGHT(FMT, ...) std::fprintf(stderr, "\x1B[93m" FMT "\x1B[0m" __VA_OPT__(,) __VA_ARGS__)
#define ERROR(FMT, ...) std::fprintf(stderr, "\x1B[31m" FMT "\x1B[0m" __VA_OPT__(,) __VA_ARGS__)
#else
#define LOG(FMT, ...)
#define HIGHLIGHT(FMT, ...)
#define ERROR(FMT, ...)
#endif

namespace vellum
{
    template <typename T>
    T clamp(T val, T min, T max)
    {
        return val > max ? max : val < min ? min : val;
    }

    // Rejects NaN, +Inf and -Inf
    template <typename T>
    [[nodiscard]] bool IsNumber(T n)
    {
        static_assert(std::is_arithmetic_v<T>, "IsNumber expects an arithmetic type");
        if constexpr (std::is_floating_point_v<T>) return std::isfinite(n);
        else return true;
    }

    [[nodiscard]] inline bool IsSpace(char ch)
    {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
    }

    [[nodiscard]] inline std::string_view Trim(std::string_view text)
    {
        auto start = 0;
        auto end = (int)text.size();
        while (start < end && IsSpace(text[start])) start++;
        while (end > start && IsSpace(text[end - 1])) end--;
        return text.substr(start, end - start);
    }

    // Splits "mousedown  mouseup click" into its words, empty entries are skipped
    [[nodiscard]] inline std::vector<std::string_view> SplitBySpace(std::string_view text)
    {
        std::vector<std::string_view> words;
        auto idx = 0;
        auto end = (int)text.size();

        while (idx < end)
        {
            while (idx < end && IsSpace(text[idx])) idx++;
            auto start = idx;
            while (idx < end && !IsSpace(text[idx])) idx++;
            if (idx > start) words.push_back(text.substr(start, idx - start));
        }

        return words;
    }

    // Shortest round-trip representation, 50.f -> "50", 0.25f -> "0.25"
    inline void AppendNumber(std::string& out, float value)
    {
        char buffer[32];
        if (value == 0.f) value = 0.f; // drops the sign of -0
        auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
        if (ec == std::errc{}) out.append(buffer, ptr);
    }

    [[nodiscard]] inline std::string ToString(float value)
    {
        std::string result;
        AppendNumber(result, value);
        return result;
    }
}
