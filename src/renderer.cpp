#include "renderer.h"
#include "context.h"
#include "style.h"

#include <cstring>

#include <lunasvg.h>

namespace vellum
{
    static void ThrowOddCoordinates(std::string_view op, std::size_t count)
    {
        throw InvalidArgument{ std::string{ op } + " expects interleaved x, y pairs, got " +
            std::to_string(count) + " coordinates" };
    }

    EllipsePath EllipseBezierSegments(ImVec2 center, float rx, float ry)
    {
        auto ox = rx * EllipseKappa, oy = ry * EllipseKappa;
        auto x = center.x - rx, y = center.y - ry;
        auto xe = center.x + rx, ye = center.y + ry;
        auto cx = center.x, cy = center.y;

        EllipsePath path;
        path.start = ImVec2{ x, cy };
        path.segments[0] = { { x, cy - oy }, { cx - ox, y }, { cx, y } };
        path.segments[1] = { { cx + ox, y }, { xe, cy - oy }, { xe, cy } };
        path.segments[2] = { { xe, cy + oy }, { cx + ox, ye }, { cx, ye } };
        path.segments[3] = { { cx - ox, ye }, { x, cy + oy }, { x, cy } };
        return path;
    }

    std::string ToPointsString(std::span<const float> coords)
    {
        if (coords.size() % 2 != 0)
            ThrowOddCoordinates("points", coords.size());

        std::string points;
        points.reserve(coords.size() * 6);

        for (auto idx = 0; idx < (int)coords.size(); idx += 2)
        {
            if (idx > 0) points.push_back(',');
            AppendNumber(points, coords[idx]);
            points.push_back(' ');
            AppendNumber(points, coords[idx + 1]);
        }

        return points;
    }

#pragma region Bitmap

    uint32_t Bitmap::PixelAt(int32_t x, int32_t y) const
    {
        if (x < 0 || y < 0 || x >= width || y >= height)
            return 0u;

        auto argb = pixels[(size_t)y * width + x];
        auto a = (int)(argb >> 24), r = (int)((argb >> 16) & 0xff),
            g = (int)((argb >> 8) & 0xff), b = (int)(argb & 0xff);

        if (a == 0) return ToRGBA(0, 0, 0, 0);
        if (a < 255)
        {
            r = (r * 255 + a / 2) / a;
            g = (g * 255 + a / 2) / a;
            b = (b * 255 + a / 2) / a;
        }

        return ToRGBA(std::min(r, 255), std::min(g, 255), std::min(b, 255), a);
    }

    std::vector<unsigned char> Bitmap::ToRGBABytes() const
    {
        std::vector<unsigned char> bytes;
        bytes.reserve(pixels.size() * 4);

        for (auto y = 0; y < height; ++y)
            for (auto x = 0; x < width; ++x)
            {
                auto [r, g, b, a] = DecomposeColor(PixelAt(x, y));
                bytes.push_back((unsigned char)r);
                bytes.push_back((unsigned char)g);
                bytes.push_back((unsigned char)b);
                bytes.push_back((unsigned char)a);
            }

        return bytes;
    }

    bool Bitmap::WritePng(std::string_view path) const
    {
        if (empty())
        {
            ERROR("Cannot write an empty bitmap to %.*s\n", (int)path.size(), path.data());
            return false;
        }

        auto copy = pixels;
        auto surface = plutovg_surface_create_for_data((unsigned char*)copy.data(), width, height, width * 4);
        if (surface == nullptr)
        {
            ERROR("Failed to wrap %dx%d bitmap for PNG output\n", width, height);
            return false;
        }

        auto filename = std::string{ path };
        auto result = plutovg_surface_write_to_png(surface, filename.c_str());
        plutovg_surface_destroy(surface);

        if (!result) ERROR("Failed to write PNG to %s\n", filename.c_str());
        return result;
    }

#pragma endregion

#pragma region SVG Renderer

    SVGSurface::SVGSurface(ImVec2 sz)
        : size{ sz }, root{ SvgElement::Create("svg", { { "xmlns", "http://www.w3.org/2000/svg" }, { "version", "1.1" } }) }
    {
        root.element->SetAttribute("width", size.x);
        root.element->SetAttribute("height", size.y);
        root.element->SetStyle("position", "absolute").SetStyle("left", "0").SetStyle("top", "0");
    }

    std::string SVGSurface::Markup() const
    {
        return root.element->Serialize();
    }

    Bitmap SVGSurface::Rasterize() const
    {
        auto width = (int32_t)std::ceil(size.x), height = (int32_t)std::ceil(size.y);
        Bitmap result{ width, height };
        if (result.empty()) return result;

        auto markup = Markup();
        auto document = lunasvg::Document::loadFromData(markup);
        if (!document)
        {
            ERROR("lunasvg failed to parse surface markup (%d bytes)\n", (int)markup.size());
            return result;
        }

        auto bitmap = document->renderToBitmap(width, height);
        if (bitmap.isNull())
        {
            ERROR("lunasvg failed to render a %dx%d surface\n", width, height);
            return result;
        }

        auto stride = bitmap.stride();
        auto rows = std::min(height, (int32_t)bitmap.height());
        auto cols = std::min(width, (int32_t)bitmap.width());

        for (auto y = 0; y < rows; ++y)
            std::memcpy(result.pixels.data() + (size_t)y * width, bitmap.data() + (size_t)y * stride, (size_t)cols * 4);

        return result;
    }

    void ApplyPresentationAttributes(SvgElement& element, const ResolvedStyle& style)
    {
        element.SetAttribute("fill", style.fill.has_value() ? std::string_view{ ToRGBAString(*style.fill) } : "none");
        element.SetAttribute("stroke", style.stroke.has_value() ? std::string_view{ ToRGBAString(*style.stroke) } : "none");
        element.SetAttribute("stroke-width", style.lineWidth);
        element.SetAttribute("stroke-linejoin", ToString(style.lineJoin));
        element.SetAttribute("stroke-linecap", ToString(style.lineCap));
    }

    bool ShapeHandle::SetStyle(const StyleDescriptor& style)
    {
        auto element = node.lock();
        if (!element) return false;

        ApplyPresentationAttributes(*element, ResolveStyle(style, config));
        return true;
    }

    bool ShapeHandle::SetAttribute(std::string_view key, std::string_view value)
    {
        auto element = node.lock();
        if (!element) return false;

        element->SetAttribute(key, value);
        return true;
    }

    bool ShapeHandle::SetAttribute(std::string_view key, float value)
    {
        auto element = node.lock();
        if (!element) return false;

        element->SetAttribute(key, value);
        return true;
    }

    std::optional<std::string> ShapeHandle::Attribute(std::string_view key) const
    {
        auto element = node.lock();
        if (!element) return std::nullopt;

        auto value = element->Attribute(key);
        return value.has_value() ? std::optional<std::string>{ std::string{ *value } } : std::nullopt;
    }

    bool ShapeHandle::Remove()
    {
        auto element = node.lock();
        return element ? element->Remove() : false;
    }

    struct SVGRenderer final : public IRenderer
    {
        RenderConfig config;

        explicit SVGRenderer(const RenderConfig& cfg) : config{ cfg } {}

        BackendType Type() const override { return BackendType::SVG; }

        bool IsSupported() override
        {
            auto& env = config.environment ? *config.environment : GetHostEnvironment();
            return env.HasFeature(VELLUM_SVG_FEATURE_SHAPE, VELLUM_SVG_FEATURE_VERSION);
        }

        std::unique_ptr<ISurface> GetCanvas(ImVec2 size) override
        {
            if (!(size.x > 0.f && size.y > 0.f && IsNumber(size.x) && IsNumber(size.y)))
            {
                ERROR("Cannot create a %fx%f SVG surface\n", size.x, size.y);
                return nullptr;
            }

            return std::make_unique<SVGSurface>(size);
        }

        SVGSurface& ToSurface(ISurface& surface) const
        {
            auto svg = dynamic_cast<SVGSurface*>(&surface);
            if (svg == nullptr) throw InvalidArgument{ "surface was not created by the SVG renderer" };
            return *svg;
        }

        SvgElement& ToTarget(IDrawContext& target) const
        {
            auto context = dynamic_cast<SVGContext*>(&target);
            if (context == nullptr || !context->element)
                throw InvalidArgument{ "draw target is not an attached SVG element" };
            return *context->element;
        }

        IDrawContext& GetContext(ISurface& surface, std::string_view type) override
        {
            auto& svg = ToSurface(surface);
            auto element = SvgElement::Create(type.empty() ? "g" : type);
            svg.Root()->AppendChild(element);

            // Slots of contexts detached by Clear() are handed out again
            auto it = std::find_if(svg.contexts.begin(), svg.contexts.end(),
                [](const auto& context) { return !context->element; });
            if (it != svg.contexts.end())
            {
                (*it)->element = element;
                return **it;
            }

            return *svg.contexts.emplace_back(std::make_unique<SVGContext>(element));
        }

        void RemoveAllNodes(SVGSurface& svg)
        {
            svg.Root()->Empty();
            for (auto& context : svg.contexts)
                context->element.reset();
        }

        void Clear(ISurface& surface) override
        {
            RemoveAllNodes(ToSurface(surface));
            LOG_DRAW(config, BackendType::SVG, "clear");
        }

        void Empty(ISurface& surface) override
        {
            RemoveAllNodes(ToSurface(surface));
            LOG_DRAW(config, BackendType::SVG, "empty");
        }

        ShapeHandle Append(SvgElement& target, const std::shared_ptr<SvgElement>& element, const ResolvedStyle& style)
        {
            ApplyPresentationAttributes(*element, style);
            target.AppendChild(element);
            return ShapeHandle{ element, config };
        }

        ShapeHandle DrawCircle(IDrawContext& target, ImVec2 center, float radius, const StyleDescriptor& style) override
        {
            auto& parent = ToTarget(target);
            auto resolved = ResolveStyle(style, config);
            [[maybe_unused]] float geometry[] = { center.x, center.y, radius };
            LOG_DRAW(config, BackendType::SVG, "circle", geometry, resolved);

            auto element = SvgElement::Create("circle");
            element->SetAttribute("cx", center.x).SetAttribute("cy", center.y).SetAttribute("r", radius);
            return Append(parent, element, resolved);
        }

        ShapeHandle DrawEllipse(IDrawContext& target, ImVec2 center, float rx, float ry, const StyleDescriptor& style) override
        {
            auto& parent = ToTarget(target);
            auto resolved = ResolveStyle(style, config);
            [[maybe_unused]] float geometry[] = { center.x, center.y, rx, ry };
            LOG_DRAW(config, BackendType::SVG, "ellipse", geometry, resolved);

            auto element = SvgElement::Create("ellipse");
            element->SetAttribute("cx", center.x).SetAttribute("cy", center.y)
                .SetAttribute("rx", rx).SetAttribute("ry", ry);
            return Append(parent, element, resolved);
        }

        ShapeHandle DrawRect(IDrawContext& target, ImVec2 pos, ImVec2 size, const StyleDescriptor& style) override
        {
            auto& parent = ToTarget(target);
            auto resolved = ResolveStyle(style, config);
            [[maybe_unused]] float geometry[] = { pos.x, pos.y, size.x, size.y };
            LOG_DRAW(config, BackendType::SVG, "rect", geometry, resolved);

            auto element = SvgElement::Create("rect");
            element->SetAttribute("x", pos.x).SetAttribute("y", pos.y)
                .SetAttribute("width", size.x).SetAttribute("height", size.y);
            return Append(parent, element, resolved);
        }

        ShapeHandle DrawLine(IDrawContext& target, ImVec2 startpos, ImVec2 endpos, const StyleDescriptor& style) override
        {
            auto& parent = ToTarget(target);
            auto resolved = ResolveStyle(style, config);
            [[maybe_unused]] float geometry[] = { startpos.x, startpos.y, endpos.x, endpos.y };
            LOG_DRAW(config, BackendType::SVG, "line", geometry, resolved);

            auto element = SvgElement::Create("line");
            element->SetAttribute("x1", startpos.x).SetAttribute("y1", startpos.y)
                .SetAttribute("x2", endpos.x).SetAttribute("y2", endpos.y);
            return Append(parent, element, resolved);
        }

        ShapeHandle DrawPoints(std::string_view name, IDrawContext& target, std::span<const float> coords, const StyleDescriptor& style)
        {
            auto& parent = ToTarget(target);
            auto resolved = ResolveStyle(style, config);
            auto points = ToPointsString(coords);
            LOG_DRAW(config, BackendType::SVG, name, coords, resolved);

            if (coords.empty()) return ShapeHandle{ {}, config };

            auto element = SvgElement::Create(name);
            element->SetAttribute("points", points);
            return Append(parent, element, resolved);
        }

        ShapeHandle DrawPolyline(IDrawContext& target, std::span<const float> coords, const StyleDescriptor& style) override
        {
            return DrawPoints("polyline", target, coords, style);
        }

        ShapeHandle DrawPolygon(IDrawContext& target, std::span<const float> coords, const StyleDescriptor& style) override
        {
            return DrawPoints("polygon", target, coords, style);
        }
    };

    std::unique_ptr<IRenderer> CreateSVGRenderer(const RenderConfig& config)
    {
        return std::make_unique<SVGRenderer>(config);
    }

#pragma endregion

#pragma region Raster Renderer

    RasterSurface::RasterSurface(ImVec2 sz)
        : size{ sz }
    {
        auto width = (int)std::ceil(size.x), height = (int)std::ceil(size.y);

        if (width > 0 && height > 0)
            surface = plutovg_surface_create(width, height);

        if (surface == nullptr)
        {
            ERROR("Failed to create %dx%d raster surface\n", width, height);
            return;
        }

        context.canvas = plutovg_canvas_create(surface);
        if (context.canvas == nullptr)
            ERROR("Failed to create canvas for %dx%d raster surface\n", width, height);

        Erase();
    }

    RasterSurface::~RasterSurface()
    {
        if (context.canvas != nullptr) plutovg_canvas_destroy(context.canvas);
        if (surface != nullptr) plutovg_surface_destroy(surface);
    }

    void RasterSurface::Erase()
    {
        if (surface == nullptr) return;

        auto stride = plutovg_surface_get_stride(surface);
        auto height = plutovg_surface_get_height(surface);
        std::memset(plutovg_surface_get_data(surface), 0, (size_t)stride * height);
    }

    Bitmap RasterSurface::Snapshot() const
    {
        if (surface == nullptr) return Bitmap{};

        auto width = plutovg_surface_get_width(surface);
        auto height = plutovg_surface_get_height(surface);
        auto stride = plutovg_surface_get_stride(surface);
        auto data = plutovg_surface_get_data(surface);

        Bitmap result{ width, height };
        for (auto y = 0; y < height; ++y)
            std::memcpy(result.pixels.data() + (size_t)y * width, data + (size_t)y * stride, (size_t)width * 4);

        return result;
    }

    uint32_t RasterSurface::PixelAt(int32_t x, int32_t y) const
    {
        if (surface == nullptr) return 0u;

        auto width = plutovg_surface_get_width(surface);
        auto height = plutovg_surface_get_height(surface);
        if (x < 0 || y < 0 || x >= width || y >= height) return 0u;

        Bitmap pixel{ 1, 1 };
        auto data = plutovg_surface_get_data(surface) + (size_t)y * plutovg_surface_get_stride(surface);
        std::memcpy(pixel.pixels.data(), data + (size_t)x * 4, 4);
        return pixel.PixelAt(0, 0);
    }

    static plutovg_line_join_t ToPlutoJoin(LineJoin join)
    {
        switch (join)
        {
        case LineJoin::Bevel: return PLUTOVG_LINE_JOIN_BEVEL;
        case LineJoin::Miter: return PLUTOVG_LINE_JOIN_MITER;
        default: return PLUTOVG_LINE_JOIN_ROUND;
        }
    }

    static plutovg_line_cap_t ToPlutoCap(LineCap cap)
    {
        switch (cap)
        {
        case LineCap::Round: return PLUTOVG_LINE_CAP_ROUND;
        case LineCap::Square: return PLUTOVG_LINE_CAP_SQUARE;
        default: return PLUTOVG_LINE_CAP_BUTT;
        }
    }

    static void SetColor(plutovg_canvas_t* canvas, const Color& color)
    {
        plutovg_canvas_set_rgba(canvas, (float)color.r / 255.f, (float)color.g / 255.f,
            (float)color.b / 255.f, clamp(color.a, 0.f, 1.f));
    }

    struct RasterRenderer final : public IRenderer
    {
        RenderConfig config;

        explicit RasterRenderer(const RenderConfig& cfg) : config{ cfg } {}

        BackendType Type() const override { return BackendType::Raster; }

        bool IsSupported() override
        {
            auto& env = config.environment ? *config.environment : GetHostEnvironment();
            return env.CanCreateContext(VELLUM_RASTER_CONTEXT_TYPE);
        }

        std::unique_ptr<ISurface> GetCanvas(ImVec2 size) override
        {
            auto surface = std::make_unique<RasterSurface>(size);
            return surface->IsValid() ? std::move(surface) : nullptr;
        }

        RasterSurface& ToSurface(ISurface& surface) const
        {
            auto raster = dynamic_cast<RasterSurface*>(&surface);
            if (raster == nullptr) throw InvalidArgument{ "surface was not created by the raster renderer" };
            return *raster;
        }

        plutovg_canvas_t* ToCanvas(IDrawContext& target) const
        {
            auto context = dynamic_cast<RasterContext*>(&target);
            if (context == nullptr || context->canvas == nullptr)
                throw InvalidArgument{ "draw target is not a raster 2d context" };
            return context->canvas;
        }

        IDrawContext& GetContext(ISurface& surface, std::string_view type) override
        {
            auto& raster = ToSurface(surface);
            if (!type.empty() && !AreSame(type, VELLUM_RASTER_CONTEXT_TYPE))
                throw InvalidArgument{ "raster surfaces only provide a \"2d\" context, requested: " + std::string{ type } };
            return raster.Context();
        }

        void Clear(ISurface& surface) override
        {
            ToSurface(surface).Erase();
            LOG_DRAW(config, BackendType::Raster, "clear");
        }

        void Empty(ISurface& surface) override
        {
            ToSurface(surface).Erase();
            LOG_DRAW(config, BackendType::Raster, "empty");
        }

        // Fill first, then stroke, on the current path
        void Paint(plutovg_canvas_t* canvas, const ResolvedStyle& style)
        {
            if (style.HasFill())
            {
                SetColor(canvas, *style.fill);
                plutovg_canvas_fill_preserve(canvas);
            }

            if (style.HasStroke())
            {
                SetColor(canvas, *style.stroke);
                plutovg_canvas_set_line_width(canvas, style.lineWidth);
                plutovg_canvas_set_line_join(canvas, ToPlutoJoin(style.lineJoin));
                plutovg_canvas_set_line_cap(canvas, ToPlutoCap(style.lineCap));
                plutovg_canvas_stroke_preserve(canvas);
            }

            plutovg_canvas_new_path(canvas);
        }

        ShapeHandle DrawCircle(IDrawContext& target, ImVec2 center, float radius, const StyleDescriptor& style) override
        {
            auto canvas = ToCanvas(target);
            auto resolved = ResolveStyle(style, config);
            [[maybe_unused]] float geometry[] = { center.x, center.y, radius };
            LOG_DRAW(config, BackendType::Raster, "circle", geometry, resolved);

            plutovg_canvas_new_path(canvas);
            plutovg_canvas_arc(canvas, center.x, center.y, radius, 0.f, 2.f * IM_PI, false);
            plutovg_canvas_close_path(canvas);
            Paint(canvas, resolved);
            return ShapeHandle{ {}, config };
        }

        ShapeHandle DrawEllipse(IDrawContext& target, ImVec2 center, float rx, float ry, const StyleDescriptor& style) override
        {
            auto canvas = ToCanvas(target);
            auto resolved = ResolveStyle(style, config);
            [[maybe_unused]] float geometry[] = { center.x, center.y, rx, ry };
            LOG_DRAW(config, BackendType::Raster, "ellipse", geometry, resolved);

            auto path = EllipseBezierSegments(center, rx, ry);
            plutovg_canvas_new_path(canvas);
            plutovg_canvas_move_to(canvas, path.start.x, path.start.y);

            for (const auto& segment : path.segments)
                plutovg_canvas_cubic_to(canvas, segment.control1.x, segment.control1.y,
                    segment.control2.x, segment.control2.y, segment.end.x, segment.end.y);

            plutovg_canvas_close_path(canvas);
            Paint(canvas, resolved);
            return ShapeHandle{ {}, config };
        }

        ShapeHandle DrawRect(IDrawContext& target, ImVec2 pos, ImVec2 size, const StyleDescriptor& style) override
        {
            auto canvas = ToCanvas(target);
            auto resolved = ResolveStyle(style, config);
            [[maybe_unused]] float geometry[] = { pos.x, pos.y, size.x, size.y };
            LOG_DRAW(config, BackendType::Raster, "rect", geometry, resolved);

            plutovg_canvas_new_path(canvas);
            plutovg_canvas_rect(canvas, pos.x, pos.y, size.x, size.y);
            Paint(canvas, resolved);
            return ShapeHandle{ {}, config };
        }

        ShapeHandle DrawLine(IDrawContext& target, ImVec2 startpos, ImVec2 endpos, const StyleDescriptor& style) override
        {
            auto canvas = ToCanvas(target);
            auto resolved = ResolveStyle(style, config);
            [[maybe_unused]] float geometry[] = { startpos.x, startpos.y, endpos.x, endpos.y };
            LOG_DRAW(config, BackendType::Raster, "line", geometry, resolved);

            plutovg_canvas_new_path(canvas);
            plutovg_canvas_move_to(canvas, startpos.x, startpos.y);
            plutovg_canvas_line_to(canvas, endpos.x, endpos.y);
            Paint(canvas, resolved);
            return ShapeHandle{ {}, config };
        }

        ShapeHandle DrawPoints(std::string_view name, IDrawContext& target, std::span<const float> coords,
            const StyleDescriptor& style, bool closed)
        {
            auto canvas = ToCanvas(target);
            auto resolved = ResolveStyle(style, config);
            if (coords.size() % 2 != 0) ThrowOddCoordinates(name, coords.size());
            LOG_DRAW(config, BackendType::Raster, name, coords, resolved);

            if (coords.empty()) return ShapeHandle{ {}, config };

            plutovg_canvas_new_path(canvas);
            plutovg_canvas_move_to(canvas, coords[0], coords[1]);

            for (auto idx = 2; idx < (int)coords.size(); idx += 2)
                plutovg_canvas_line_to(canvas, coords[idx], coords[idx + 1]);

            if (closed) plutovg_canvas_close_path(canvas);
            Paint(canvas, resolved);
            return ShapeHandle{ {}, config };
        }

        ShapeHandle DrawPolyline(IDrawContext& target, std::span<const float> coords, const StyleDescriptor& style) override
        {
            return DrawPoints("polyline", target, coords, style, false);
        }

        ShapeHandle DrawPolygon(IDrawContext& target, std::span<const float> coords, const StyleDescriptor& style) override
        {
            return DrawPoints("polygon", target, coords, style, true);
        }
    };

    std::unique_ptr<IRenderer> CreateRasterRenderer(const RenderConfig& config)
    {
        return std::make_unique<RasterRenderer>(config);
    }

#pragma endregion

#pragma region Null Renderer

    struct NullRenderer final : public IRenderer
    {
        [[noreturn]] static void Fail()
        {
            throw ConfigurationError{ "no supported rendering backend" };
        }

        BackendType Type() const override { return BackendType::None; }
        bool IsSupported() override { return false; }

        std::unique_ptr<ISurface> GetCanvas(ImVec2) override { Fail(); }
        IDrawContext& GetContext(ISurface&, std::string_view) override { Fail(); }
        void Clear(ISurface&) override { Fail(); }
        void Empty(ISurface&) override { Fail(); }

        ShapeHandle DrawCircle(IDrawContext&, ImVec2, float, const StyleDescriptor&) override { Fail(); }
        ShapeHandle DrawEllipse(IDrawContext&, ImVec2, float, float, const StyleDescriptor&) override { Fail(); }
        ShapeHandle DrawRect(IDrawContext&, ImVec2, ImVec2, const StyleDescriptor&) override { Fail(); }
        ShapeHandle DrawLine(IDrawContext&, ImVec2, ImVec2, const StyleDescriptor&) override { Fail(); }
        ShapeHandle DrawPolyline(IDrawContext&, std::span<const float>, const StyleDescriptor&) override { Fail(); }
        ShapeHandle DrawPolygon(IDrawContext&, std::span<const float>, const StyleDescriptor&) override { Fail(); }
    };

    std::unique_ptr<IRenderer> CreateNullRenderer()
    {
        return std::make_unique<NullRenderer>();
    }

#pragma endregion
}
