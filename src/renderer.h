#pragma once

#include "types.h"
#include "dom.h"

#include <memory>
#include <span>

#include <plutovg.h>

namespace vellum
{
    // =============================================================================================
    // PIXELS
    // =============================================================================================

    // Pixels are stored the way plutovg and lunasvg produce them: premultiplied ARGB32,
    // one uint32_t per pixel, rows packed without padding.
    struct Bitmap
    {
        int32_t width = 0;
        int32_t height = 0;
        std::vector<uint32_t> pixels;

        Bitmap() = default;
        Bitmap(int32_t w, int32_t h)
            : width{ std::max(w, 0) }, height{ std::max(h, 0) }, pixels((size_t)width * (size_t)height, 0u) {}

        [[nodiscard]] bool empty() const { return width <= 0 || height <= 0; }

        // Unpremultiplied color packed as ToRGBA(), transparent black outside the bitmap
        [[nodiscard]] uint32_t PixelAt(int32_t x, int32_t y) const;

        // Tightly packed RGBA8 bytes, suitable for a GL_RGBA texture
        [[nodiscard]] std::vector<unsigned char> ToRGBABytes() const;

        bool WritePng(std::string_view path) const;
    };

    // =============================================================================================
    // SURFACES
    // =============================================================================================

    // Drawing target handed to the Draw* calls. For the vector backend it is an element
    // (the root <svg> or a child group), for the raster backend the 2D context of a pixel buffer.
    struct IDrawContext
    {
        virtual ~IDrawContext() = default;
        virtual BackendType Backend() const = 0;
    };

    struct ISurface
    {
        virtual ~ISurface() = default;
        virtual BackendType Backend() const = 0;
        virtual ImVec2 Size() const = 0;
        virtual IDrawContext& Context() = 0;

        // Flattened content, used for compositing and export
        virtual Bitmap Rasterize() const = 0;
    };

    struct SVGContext final : public IDrawContext
    {
        std::shared_ptr<SvgElement> element;

        explicit SVGContext(std::shared_ptr<SvgElement> el) : element{ std::move(el) } {}
        BackendType Backend() const override { return BackendType::SVG; }
    };

    struct SVGSurface final : public ISurface
    {
        explicit SVGSurface(ImVec2 size);

        BackendType Backend() const override { return BackendType::SVG; }
        ImVec2 Size() const override { return size; }
        IDrawContext& Context() override { return root; }
        Bitmap Rasterize() const override;

        [[nodiscard]] const std::shared_ptr<SvgElement>& Root() const { return root.element; }
        [[nodiscard]] std::string Markup() const;

        ImVec2 size;
        SVGContext root;
        // Group contexts handed out by GetContext(), Clear() detaches them and reuses their slots
        std::vector<std::unique_ptr<SVGContext>> contexts;
    };

    struct RasterContext final : public IDrawContext
    {
        plutovg_canvas_t* canvas = nullptr;

        BackendType Backend() const override { return BackendType::Raster; }
    };

    // Owns a plutovg surface and a canvas bound to it
    struct RasterSurface final : public ISurface
    {
        explicit RasterSurface(ImVec2 size);
        ~RasterSurface();

        RasterSurface(const RasterSurface&) = delete;
        RasterSurface& operator=(const RasterSurface&) = delete;

        BackendType Backend() const override { return BackendType::Raster; }
        ImVec2 Size() const override { return size; }
        IDrawContext& Context() override { return context; }
        Bitmap Rasterize() const override { return Snapshot(); }

        [[nodiscard]] bool IsValid() const { return surface != nullptr && context.canvas != nullptr; }
        [[nodiscard]] Bitmap Snapshot() const;
        [[nodiscard]] uint32_t PixelAt(int32_t x, int32_t y) const;
        void Erase();

        ImVec2 size;
        plutovg_surface_t* surface = nullptr;
        RasterContext context;
    };

    // =============================================================================================
    // SHAPES
    // =============================================================================================

    // Reference to a node created by the vector backend. The raster backend returns
    // an empty handle, since nothing is retained there the caller replays draws instead.
    struct ShapeHandle
    {
        std::weak_ptr<SvgElement> node;
        RenderConfig config;

        explicit operator bool() const { return !node.expired(); }

        // Re-applies fill/stroke presentation attributes, false if the node is gone
        bool SetStyle(const StyleDescriptor& style);
        bool SetAttribute(std::string_view key, std::string_view value);
        bool SetAttribute(std::string_view key, float value);
        [[nodiscard]] std::optional<std::string> Attribute(std::string_view key) const;
        bool Remove();
        [[nodiscard]] std::shared_ptr<SvgElement> Element() const { return node.lock(); }
    };

    struct BezierSegment
    {
        ImVec2 control1, control2, end;
    };

    struct EllipsePath
    {
        ImVec2 start;
        BezierSegment segments[4];
    };

    inline constexpr float EllipseKappa = 0.5522848f;

    // Starts at the left-most point and runs through top, right and bottom
    [[nodiscard]] EllipsePath EllipseBezierSegments(ImVec2 center, float rx, float ry);

    // =============================================================================================
    // LOGGING
    // =============================================================================================

    struct IDrawLogger
    {
        virtual ~IDrawLogger() = default;
        virtual void Log(BackendType backend, std::string_view op, std::span<const float> geometry, const ResolvedStyle& style) = 0;
        virtual void Log(BackendType backend, std::string_view op) = 0;
    };

#ifdef VELLUM_ENABLE_TESTING
#define LOG_DRAW(CONFIG, ...) if ((CONFIG).logger) (CONFIG).logger->Log(__VA_ARGS__)
#else
#define LOG_DRAW(CONFIG, ...)
#endif

    // =============================================================================================
    // RENDERER
    // =============================================================================================

    // Shape drawing contract shared by every backend. Chart code holds an IRenderer
    // and never branches on the concrete backend.
    // Coordinate lists are interleaved x, y pairs and must have an even length,
    // odd lists throw InvalidArgument before the target is touched.
    struct IRenderer
    {
        virtual ~IRenderer() = default;

        virtual BackendType Type() const = 0;
        virtual bool IsSupported() = 0;

        virtual std::unique_ptr<ISurface> GetCanvas(ImVec2 size) = 0;
        // Empty type picks the backend default, "g" for SVG and "2d" for raster
        virtual IDrawContext& GetContext(ISurface& surface, std::string_view type = {}) = 0;
        virtual void Clear(ISurface& surface) = 0;
        virtual void Empty(ISurface& surface) = 0;

        virtual ShapeHandle DrawCircle(IDrawContext& target, ImVec2 center, float radius, const StyleDescriptor& style = {}) = 0;
        virtual ShapeHandle DrawEllipse(IDrawContext& target, ImVec2 center, float rx, float ry, const StyleDescriptor& style = {}) = 0;
        virtual ShapeHandle DrawRect(IDrawContext& target, ImVec2 pos, ImVec2 size, const StyleDescriptor& style = {}) = 0;
        virtual ShapeHandle DrawLine(IDrawContext& target, ImVec2 startpos, ImVec2 endpos, const StyleDescriptor& style = {}) = 0;
        virtual ShapeHandle DrawPolyline(IDrawContext& target, std::span<const float> coords, const StyleDescriptor& style = {}) = 0;
        virtual ShapeHandle DrawPolygon(IDrawContext& target, std::span<const float> coords, const StyleDescriptor& style = {}) = 0;
    };

    // =============================================================================================
    // IMPLEMENTATIONS
    // =============================================================================================

    // Serializes coordinates as "x1 y1,x2 y2,...", throws InvalidArgument for odd lengths
    [[nodiscard]] std::string ToPointsString(std::span<const float> coords);

    // Writes fill, stroke, stroke-width, stroke-linejoin and stroke-linecap
    void ApplyPresentationAttributes(SvgElement& element, const ResolvedStyle& style);

    std::unique_ptr<IRenderer> CreateSVGRenderer(const RenderConfig& config);
    std::unique_ptr<IRenderer> CreateRasterRenderer(const RenderConfig& config);

    // Selected when no backend is supported, every call throws ConfigurationError
    std::unique_ptr<IRenderer> CreateNullRenderer();
}
