#include "style.h"

#include <cctype>
#include <cstring>
#include <unordered_map>

namespace vellum
{
    static char ToLower(char ch)
    {
        return (char)std::tolower((unsigned char)ch);
    }

    [[nodiscard]] bool AreSame(const std::string_view lhs, const std::string_view rhs)
    {
        auto rlimit = (int)rhs.size();
        auto llimit = (int)lhs.size();
        if (rlimit != llimit)
            return false;

        for (auto idx = 0; idx < rlimit; ++idx)
            if (ToLower(lhs[idx]) != ToLower(rhs[idx]))
                return false;

        return true;
    }

    [[nodiscard]] bool StartsWith(const std::string_view lhs, const std::string_view rhs)
    {
        auto rlimit = (int)rhs.size();
        auto llimit = (int)lhs.size();
        if (rlimit > llimit)
            return false;

        for (auto idx = 0; idx < rlimit; ++idx)
            if (ToLower(lhs[idx]) != ToLower(rhs[idx]))
                return false;

        return true;
    }

    template <int maxsz>
    struct CaseInsensitiveHasher
    {
        std::size_t operator()(std::string_view key) const
        {
            char buffer[maxsz] = { 0 };
            auto limit = std::min((int)key.size(), maxsz - 1);

            for (auto idx = 0; idx < limit; ++idx)
                buffer[idx] = ToLower(key[idx]);

            return std::hash<std::string_view>()(std::string_view{ buffer, (size_t)limit });
        }
    };

    struct CaseInsensitiveEquals
    {
        bool operator()(std::string_view lhs, std::string_view rhs) const { return AreSame(lhs, rhs); }
    };

    std::optional<Color> GetColor(std::string_view name)
    {
        const static std::unordered_map<std::string_view, Color, CaseInsensitiveHasher<32>, CaseInsensitiveEquals> Colors{
            { "black", { 0, 0, 0 } },
            { "silver", { 192, 192, 192 } },
            { "gray", { 128, 128, 128 } },
            { "grey", { 128, 128, 128 } },
            { "white", { 255, 255, 255 } },
            { "maroon", { 128, 0, 0 } },
            { "red", { 255, 0, 0 } },
            { "purple", { 128, 0, 128 } },
            { "fuchsia", { 255, 0, 255 } },
            { "magenta", { 255, 0, 255 } },
            { "green", { 0, 128, 0 } },
            { "lime", { 0, 255, 0 } },
            { "olive", { 128, 128, 0 } },
            { "yellow", { 255, 255, 0 } },
            { "navy", { 0, 0, 128 } },
            { "blue", { 0, 0, 255 } },
            { "teal", { 0, 128, 128 } },
            { "aqua", { 0, 255, 255 } },
            { "cyan", { 0, 255, 255 } },
            { "aliceblue", { 240, 248, 255 } },
            { "antiquewhite", { 250, 235, 215 } },
            { "aquamarine", { 127, 255, 212 } },
            { "azure", { 240, 255, 255 } },
            { "beige", { 245, 245, 220 } },
            { "bisque", { 255, 228, 196 } },
            { "blanchedalmond", { 255, 235, 205 } },
            { "blueviolet", { 138, 43, 226 } },
            { "brown", { 165, 42, 42 } },
            { "burlywood", { 222, 184, 135 } },
            { "cadetblue", { 95, 158, 160 } },
            { "chartreuse", { 127, 255, 0 } },
            { "chocolate", { 210, 105, 30 } },
            { "coral", { 255, 127, 80 } },
            { "cornflowerblue", { 100, 149, 237 } },
            { "cornsilk", { 255, 248, 220 } },
            { "crimson", { 220, 20, 60 } },
            { "darkblue", { 0, 0, 139 } },
            { "darkcyan", { 0, 139, 139 } },
            { "darkgoldenrod", { 184, 134, 11 } },
            { "darkgray", { 169, 169, 169 } },
            { "darkgreen", { 0, 100, 0 } },
            { "darkkhaki", { 189, 183, 107 } },
            { "darkmagenta", { 139, 0, 139 } },
            { "darkolivegreen", { 85, 107, 47 } },
            { "darkorange", { 255, 140, 0 } },
            { "darkorchid", { 153, 50, 204 } },
            { "darkred", { 139, 0, 0 } },
            { "darksalmon", { 233, 150, 122 } },
            { "darkseagreen", { 143, 188, 143 } },
            { "darkslateblue", { 72, 61, 139 } },
            { "darkslategray", { 47, 79, 79 } },
            { "darkturquoise", { 0, 206, 209 } },
            { "darkviolet", { 148, 0, 211 } },
            { "deeppink", { 255, 20, 147 } },
            { "deepskyblue", { 0, 191, 255 } },
            { "dimgray", { 105, 105, 105 } },
            { "dodgerblue", { 30, 144, 255 } },
            { "firebrick", { 178, 34, 34 } },
            { "floralwhite", { 255, 250, 240 } },
            { "forestgreen", { 34, 139, 34 } },
            { "gainsboro", { 220, 220, 220 } },
            { "ghostwhite", { 248, 248, 255 } },
            { "gold", { 255, 215, 0 } },
            { "goldenrod", { 218, 165, 32 } },
            { "greenyellow", { 173, 255, 47 } },
            { "honeydew", { 240, 255, 240 } },
            { "hotpink", { 255, 105, 180 } },
            { "indianred", { 205, 92, 92 } },
            { "indigo", { 75, 0, 130 } },
            { "ivory", { 255, 255, 240 } },
            { "khaki", { 240, 230, 140 } },
            { "lavender", { 230, 230, 250 } },
            { "lavenderblush", { 255, 240, 245 } },
            { "lawngreen", { 124, 252, 0 } },
            { "lemonchiffon", { 255, 250, 205 } },
            { "lightblue", { 173, 216, 230 } },
            { "lightcoral", { 240, 128, 128 } },
            { "lightcyan", { 224, 255, 255 } },
            { "lightgoldenrodyellow", { 250, 250, 210 } },
            { "lightgray", { 211, 211, 211 } },
            { "lightgreen", { 144, 238, 144 } },
            { "lightpink", { 255, 182, 193 } },
            { "lightsalmon", { 255, 160, 122 } },
            { "lightseagreen", { 32, 178, 170 } },
            { "lightskyblue", { 135, 206, 250 } },
            { "lightslategray", { 119, 136, 153 } },
            { "lightsteelblue", { 176, 196, 222 } },
            { "lightyellow", { 255, 255, 224 } },
            { "limegreen", { 50, 205, 50 } },
            { "linen", { 250, 240, 230 } },
            { "mediumaquamarine", { 102, 205, 170 } },
            { "mediumblue", { 0, 0, 205 } },
            { "mediumorchid", { 186, 85, 211 } },
            { "mediumpurple", { 147, 112, 219 } },
            { "mediumseagreen", { 60, 179, 113 } },
            { "mediumslateblue", { 123, 104, 238 } },
            { "mediumspringgreen", { 0, 250, 154 } },
            { "mediumturquoise", { 72, 209, 204 } },
            { "mediumvioletred", { 199, 21, 133 } },
            { "midnightblue", { 25, 25, 112 } },
            { "mintcream", { 245, 255, 250 } },
            { "mistyrose", { 255, 228, 225 } },
            { "moccasin", { 255, 228, 181 } },
            { "navajowhite", { 255, 222, 173 } },
            { "oldlace", { 253, 245, 230 } },
            { "olivedrab", { 107, 142, 35 } },
            { "orange", { 255, 165, 0 } },
            { "orangered", { 255, 69, 0 } },
            { "orchid", { 218, 112, 214 } },
            { "palegoldenrod", { 238, 232, 170 } },
            { "palegreen", { 152, 251, 152 } },
            { "paleturquoise", { 175, 238, 238 } },
            { "palevioletred", { 219, 112, 147 } },
            { "papayawhip", { 255, 239, 213 } },
            { "peachpuff", { 255, 218, 185 } },
            { "peru", { 205, 133, 63 } },
            { "pink", { 255, 192, 203 } },
            { "plum", { 221, 160, 221 } },
            { "powderblue", { 176, 224, 230 } },
            { "rosybrown", { 188, 143, 143 } },
            { "royalblue", { 65, 105, 225 } },
            { "saddlebrown", { 139, 69, 19 } },
            { "salmon", { 250, 128, 114 } },
            { "sandybrown", { 244, 164, 96 } },
            { "seagreen", { 46, 139, 87 } },
            { "seashell", { 255, 245, 238 } },
            { "sienna", { 160, 82, 45 } },
            { "skyblue", { 135, 206, 235 } },
            { "slateblue", { 106, 90, 205 } },
            { "slategray", { 112, 128, 144 } },
            { "snow", { 255, 250, 250 } },
            { "springgreen", { 0, 255, 127 } },
            { "steelblue", { 70, 130, 180 } },
            { "tan", { 210, 180, 140 } },
            { "thistle", { 216, 191, 216 } },
            { "tomato", { 255, 99, 71 } },
            { "turquoise", { 64, 224, 208 } },
            { "violet", { 238, 130, 238 } },
            { "wheat", { 245, 222, 179 } },
            { "whitesmoke", { 245, 245, 245 } },
            { "yellowgreen", { 154, 205, 50 } }
        };

        auto it = Colors.find(name);
        return it != Colors.end() ? std::optional<Color>{ it->second } : std::nullopt;
    }

    struct FunctionArgs
    {
        float values[4] = { 0.f, 0.f, 0.f, 1.f };
        bool percent[4] = { false, false, false, false };
        int count = 0;
    };

    // Reads "(a, b, c[, d])", also accepts the space separated "(a b c / d)" form
    [[nodiscard]] static bool ExtractFunctionArgs(std::string_view input, FunctionArgs& args)
    {
        auto open = input.find('(');
        auto close = input.rfind(')');
        if (open == std::string_view::npos || close == std::string_view::npos || close < open)
            return false;

        auto inner = input.substr(open + 1, close - open - 1);
        auto idx = 0;
        auto end = (int)inner.size();

        while (idx < end)
        {
            while (idx < end && (IsSpace(inner[idx]) || inner[idx] == ',' || inner[idx] == '/')) idx++;
            if (idx >= end) break;
            if (args.count == 4) return false;

            auto start = inner.data() + idx;
            float value = 0.f;
            auto [ptr, ec] = std::from_chars(start, inner.data() + end, value);
            if (ec != std::errc{}) return false;

            idx += (int)(ptr - start);
            args.values[args.count] = value;

            if (idx < end && inner[idx] == '%')
            {
                args.percent[args.count] = true;
                idx++;
            }
            else if (idx < end && StartsWith(inner.substr(idx), "deg"))
                idx += 3;

            args.count++;
        }

        return args.count >= 3;
    }

    [[nodiscard]] static int ToChannel(float value, bool percent)
    {
        auto channel = percent ? value * 2.55f : value;
        return (int)std::lround(clamp(channel, 0.f, 255.f));
    }

    [[nodiscard]] static float ToAlpha(const FunctionArgs& args)
    {
        if (args.count < 4) return 1.f;
        return clamp(args.percent[3] ? args.values[3] * 0.01f : args.values[3], 0.f, 1.f);
    }

    [[nodiscard]] static int HexDigit(char ch)
    {
        if (ch >= '0' && ch <= '9') return ch - '0';
        if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
        if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
        return -1;
    }

    [[nodiscard]] static std::optional<Color> ExtractHexColor(std::string_view digits)
    {
        int values[8];
        for (auto idx = 0; idx < (int)digits.size() && idx < 8; ++idx)
        {
            values[idx] = HexDigit(digits[idx]);
            if (values[idx] == -1) return std::nullopt;
        }

        switch (digits.size())
        {
        case 3: return Color{ values[0] * 17, values[1] * 17, values[2] * 17, 1.f };
        case 4: return Color{ values[0] * 17, values[1] * 17, values[2] * 17, (float)(values[3] * 17) / 255.f };
        case 6: return Color{ values[0] * 16 + values[1], values[2] * 16 + values[3], values[4] * 16 + values[5], 1.f };
        case 8: return Color{ values[0] * 16 + values[1], values[2] * 16 + values[3], values[4] * 16 + values[5],
            (float)(values[6] * 16 + values[7]) / 255.f };
        default: return std::nullopt;
        }
    }

    std::optional<Color> ExtractColor(std::string_view input)
    {
        auto value = Trim(input);
        std::optional<Color> result;

        if (value.empty() || AreSame(value, "none"))
        {
            return std::nullopt;
        }
        else if (AreSame(value, "transparent"))
        {
            return Color{ 0, 0, 0, 0.f };
        }
        else if (value[0] == '#')
        {
            result = ExtractHexColor(value.substr(1));
        }
        else if (StartsWith(value, "rgb"))
        {
            FunctionArgs args;
            if (ExtractFunctionArgs(value, args))
                result = Color{ ToChannel(args.values[0], args.percent[0]), ToChannel(args.values[1], args.percent[1]),
                    ToChannel(args.values[2], args.percent[2]), ToAlpha(args) };
        }
        else if (StartsWith(value, "hsl"))
        {
            FunctionArgs args;
            if (ExtractFunctionArgs(value, args))
            {
                auto h = std::fmod(args.values[0], 360.f) / 360.f;
                if (h < 0.f) h += 1.f;
                auto s = clamp(args.values[1] * 0.01f, 0.f, 1.f);
                auto l = clamp(args.values[2] * 0.01f, 0.f, 1.f);

                // HSL -> HSV, then reuse the HSV conversion
                auto v = l + s * std::min(l, 1.f - l);
                auto sv = v == 0.f ? 0.f : 2.f * (1.f - (l / v));
                float r = 0.f, g = 0.f, b = 0.f;
                ImGui::ColorConvertHSVtoRGB(h, sv, v, r, g, b);
                result = Color{ (int)std::lround(r * 255.f), (int)std::lround(g * 255.f), (int)std::lround(b * 255.f), ToAlpha(args) };
            }
        }
        else if (StartsWith(value, "hsv"))
        {
            FunctionArgs args;
            if (ExtractFunctionArgs(value, args))
            {
                auto h = std::fmod(args.values[0], 360.f) / 360.f;
                if (h < 0.f) h += 1.f;
                float r = 0.f, g = 0.f, b = 0.f;
                ImGui::ColorConvertHSVtoRGB(h, clamp(args.values[1] * 0.01f, 0.f, 1.f), clamp(args.values[2] * 0.01f, 0.f, 1.f), r, g, b);
                result = Color{ (int)std::lround(r * 255.f), (int)std::lround(g * 255.f), (int)std::lround(b * 255.f), ToAlpha(args) };
            }
        }
        else
        {
            result = GetColor(value);
        }

        if (!result.has_value())
        {
            LOG("Unrecognized color [%.*s], using black\n", (int)value.size(), value.data());
            return Color{ 0, 0, 0, 1.f };
        }

        return result;
    }

    std::string ToRGBAString(const Color& color)
    {
        std::string result;
        result.reserve(32);
        result.append("rgba(");
        result.append(std::to_string(color.r)).append(",");
        result.append(std::to_string(color.g)).append(",");
        result.append(std::to_string(color.b)).append(",");
        AppendNumber(result, color.a);
        result.append(")");
        return result;
    }

    std::string ToRGBAString(std::string_view color, std::optional<float> opacity)
    {
        auto resolved = ExtractColor(color);
        if (!resolved.has_value()) return "none";
        if (opacity.has_value()) resolved->a = *opacity;
        return ToRGBAString(*resolved);
    }

    LineJoin ParseLineJoin(std::string_view name)
    {
        auto value = Trim(name);
        if (AreSame(value, "bevel")) return LineJoin::Bevel;
        if (AreSame(value, "round")) return LineJoin::Round;
        if (AreSame(value, "miter")) return LineJoin::Miter;
        throw InvalidArgument{ "line join must be one of bevel|round|miter, got: " + std::string{ name } };
    }

    LineCap ParseLineCap(std::string_view name)
    {
        auto value = Trim(name);
        if (AreSame(value, "butt")) return LineCap::Butt;
        if (AreSame(value, "round")) return LineCap::Round;
        if (AreSame(value, "square")) return LineCap::Square;
        throw InvalidArgument{ "line cap must be one of butt|round|square, got: " + std::string{ name } };
    }

    std::string_view ToString(LineJoin join)
    {
        switch (join)
        {
        case LineJoin::Bevel: return "bevel";
        case LineJoin::Miter: return "miter";
        default: return "round";
        }
    }

    std::string_view ToString(LineCap cap)
    {
        switch (cap)
        {
        case LineCap::Round: return "round";
        case LineCap::Square: return "square";
        default: return "butt";
        }
    }

    [[nodiscard]] static std::optional<float> CheckOpacity(const std::optional<float>& opacity, const char* field)
    {
        if (opacity.has_value() && (!IsNumber(*opacity) || *opacity < 0.f || *opacity > 1.f))
            throw InvalidArgument{ std::string{ field } + " must be a finite number in [0, 1], got: " + ToString(*opacity) };
        return opacity;
    }

    // Explicit opacity wins over the alpha channel of the color string.
    // "none" stays none, the opacity is then ignored.
    [[nodiscard]] static std::optional<Color> ResolvePaint(const std::optional<std::string>& color, const std::optional<float>& opacity)
    {
        if (!color.has_value()) return std::nullopt;

        auto resolved = ExtractColor(*color);
        if (resolved.has_value() && opacity.has_value()) resolved->a = *opacity;
        return resolved;
    }

    ResolvedStyle ResolveStyle(const StyleDescriptor& style, const RenderConfig& config)
    {
        ResolvedStyle result;

        if (style.lineWidth.has_value() && (!IsNumber(*style.lineWidth) || *style.lineWidth < 0.f))
            throw InvalidArgument{ "lineWidth must be a finite non-negative number, got: " + ToString(*style.lineWidth) };

        auto fillOpacity = CheckOpacity(style.fillOpacity, "fillOpacity");
        auto lineOpacity = CheckOpacity(style.lineOpacity, "lineOpacity");

        result.fill = ResolvePaint(style.fillColor, fillOpacity);
        result.stroke = ResolvePaint(style.lineColor, lineOpacity);
        result.lineWidth = style.lineWidth.value_or(config.defaultLineWidth);
        result.lineJoin = style.lineJoin.value_or(config.defaultLineJoin);
        result.lineCap = style.lineCap.value_or(config.defaultLineCap);
        return result;
    }
}
