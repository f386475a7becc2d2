#pragma once

#ifndef IMGUI_DEFINE_MATH_OPERATORS
#define IMGUI_DEFINE_MATH_OPERATORS
#endif

#include "imgui.h"
#include "imgui_internal.h"

#include "utils.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#ifndef VELLUM_DEFAULT_LINE_WIDTH
#define VELLUM_DEFAULT_LINE_WIDTH 1.f
#endif

#ifndef VELLUM_FRAME_INTERVAL_MS
#define VELLUM_FRAME_INTERVAL_MS 16
#endif

#ifndef VELLUM_SVG_FEATURE_SHAPE
#define VELLUM_SVG_FEATURE_SHAPE "http://www.w3.org/TR/SVG11/feature#Shape"
#endif

#ifndef VELLUM_SVG_FEATURE_VERSION
#define VELLUM_SVG_FEATURE_VERSION "1.0"
#endif

#ifndef VELLUM_RASTER_CONTEXT_TYPE
#define VELLUM_RASTER_CONTEXT_TYPE "2d"
#endif

namespace vellum
{
    // =============================================================================================
    // COLORS
    // =============================================================================================

    [[nodiscard]] inline uint32_t ToRGBA(int r, int g, int b, int a = 255)
    {
        return (((uint32_t)(a) << 24) |
            ((uint32_t)(b) << 16) |
            ((uint32_t)(g) << 8) |
            ((uint32_t)(r) << 0));
    }

    [[nodiscard]] inline std::tuple<int, int, int, int> DecomposeColor(uint32_t color)
    {
        return { color & 0xff, (color & 0xff00) >> 8, (color & 0xff0000) >> 16, (color & 0xff000000) >> 24 };
    }

    [[nodiscard]] inline uint32_t ToRGBA(const std::tuple<int, int, int, int>& rgba)
    {
        return ToRGBA(std::get<0>(rgba), std::get<1>(rgba), std::get<2>(rgba), std::get<3>(rgba));
    }

    inline bool IsColorVisible(uint32_t color)
    {
        return (color & 0xFF000000) != 0;
    }

    // Channels are 0-255, alpha is kept as a float so that an explicit
    // opacity survives resolution without 8-bit quantization.
    struct Color
    {
        int r = 0, g = 0, b = 0;
        float a = 1.f;

        [[nodiscard]] uint32_t packed() const
        {
            return ToRGBA(r, g, b, (int)std::lround(clamp(a, 0.f, 1.f) * 255.f));
        }

        bool operator==(const Color& other) const = default;
    };

    // =============================================================================================
    // STYLING
    // =============================================================================================

    enum class LineJoin { Bevel, Round, Miter };
    enum class LineCap { Butt, Round, Square };

    enum class BackendType { None, SVG, Raster };

    // Paint parameters of a single draw call, every field is optional.
    // fillOpacity/lineOpacity replace whatever alpha the color string carries.
    struct StyleDescriptor
    {
        std::optional<std::string> fillColor;
        std::optional<float> fillOpacity;
        std::optional<std::string> lineColor;
        std::optional<float> lineWidth;
        std::optional<LineJoin> lineJoin;
        std::optional<LineCap> lineCap;
        std::optional<float> lineOpacity;

        [[nodiscard]] StyleDescriptor WithFill(std::string_view color, std::optional<float> opacity = std::nullopt) const
        {
            auto copy = *this;
            copy.fillColor = std::string{ color };
            copy.fillOpacity = opacity;
            return copy;
        }

        [[nodiscard]] StyleDescriptor WithLine(std::string_view color, float width, std::optional<float> opacity = std::nullopt) const
        {
            auto copy = *this;
            copy.lineColor = std::string{ color };
            copy.lineWidth = width;
            copy.lineOpacity = opacity;
            return copy;
        }
    };

    // Output of ResolveStyle(), what both backends actually paint with.
    // An empty fill/stroke means no paint operation of that kind.
    struct ResolvedStyle
    {
        std::optional<Color> fill;
        std::optional<Color> stroke;
        float lineWidth = VELLUM_DEFAULT_LINE_WIDTH;
        LineJoin lineJoin = LineJoin::Round;
        LineCap lineCap = LineCap::Butt;

        [[nodiscard]] bool HasFill() const { return fill.has_value(); }
        [[nodiscard]] bool HasStroke() const { return stroke.has_value() && lineWidth != 0.f; }
    };

    // =============================================================================================
    // ERRORS
    // =============================================================================================

    struct InvalidArgument : public std::invalid_argument
    {
        using std::invalid_argument::invalid_argument;
    };

    struct ConfigurationError : public std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    // =============================================================================================
    // CONFIGURATION
    // =============================================================================================

    struct IEnvironment;
    struct IPlatform;
    struct IDrawLogger;

    struct RenderConfig
    {
        float defaultLineWidth = VELLUM_DEFAULT_LINE_WIDTH;
        LineJoin defaultLineJoin = LineJoin::Round;
        LineCap defaultLineCap = LineCap::Butt;
        int32_t frameIntervalMs = VELLUM_FRAME_INTERVAL_MS;
        IEnvironment* environment = nullptr; // Host environment is used if null
        IPlatform* platform = nullptr;
        IDrawLogger* logger = nullptr;
    };

    struct FourSidedMeasure
    {
        float top = 0.f, left = 0.f, right = 0.f, bottom = 0.f;

        float h() const { return left + right; }
        float v() const { return top + bottom; }
    };
}
