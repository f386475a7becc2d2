#pragma once

#include "types.h"

namespace vellum
{
    [[nodiscard]] bool AreSame(const std::string_view lhs, const std::string_view rhs);
    [[nodiscard]] bool StartsWith(const std::string_view lhs, const std::string_view rhs);

    // Named CSS colors, case-insensitive
    [[nodiscard]] std::optional<Color> GetColor(std::string_view name);

    // Parses #rgb, #rgba, #rrggbb, #rrggbbaa, rgb(), rgba(), hsl(), hsla(), hsv(),
    // named colors and "transparent". Returns std::nullopt for "none" (or an empty string).
    // Unparseable input resolves to opaque black.
    [[nodiscard]] std::optional<Color> ExtractColor(std::string_view input);

    // Formats as "rgba(r,g,b,a)"
    [[nodiscard]] std::string ToRGBAString(const Color& color);

    // Color Resolver: normalizes a color string to "rgba(r,g,b,a)", or "none".
    // A present opacity replaces the alpha embedded in the color.
    [[nodiscard]] std::string ToRGBAString(std::string_view color, std::optional<float> opacity = std::nullopt);

    [[nodiscard]] LineJoin ParseLineJoin(std::string_view name);
    [[nodiscard]] LineCap ParseLineCap(std::string_view name);
    [[nodiscard]] std::string_view ToString(LineJoin join);
    [[nodiscard]] std::string_view ToString(LineCap cap);

    // Single place where style defaults and the opacity override are applied.
    // Throws InvalidArgument for a negative/non-finite line width or an opacity outside [0, 1].
    [[nodiscard]] ResolvedStyle ResolveStyle(const StyleDescriptor& style, const RenderConfig& config);
}
