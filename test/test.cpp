#include "../src/vellum.h"
#include "../src/testing.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <functional>

using namespace vellum;

static std::vector<std::string> Failures;

static void Check(bool condition, std::string_view what)
{
    if (!condition)
    {
        Failures.emplace_back(what);
        std::fprintf(stderr, "\x1B[31mFAILED %.*s\x1B[0m\n", (int)what.size(), what.data());
    }
}

static void Check(TestScenario& scenario)
{
    if (!scenario.Run())
        Failures.insert(Failures.end(), scenario.failures.begin(), scenario.failures.end());
}

template <typename ExceptionT>
static bool Throws(const std::function<void()>& fn)
{
    try
    {
        fn();
    }
    catch (const ExceptionT&)
    {
        return true;
    }

    return false;
}

static bool Near(ImVec2 lhs, ImVec2 rhs, float tolerance = 1e-4f)
{
    return std::fabs(lhs.x - rhs.x) <= tolerance && std::fabs(lhs.y - rhs.y) <= tolerance;
}

static void TestColorResolution()
{
    Check(ToRGBAString("red") == "rgba(255,0,0,1)", "named color resolves to rgba");
    Check(ToRGBAString("BLUE") == "rgba(0,0,255,1)", "named colors are case-insensitive");
    Check(ToRGBAString("#0f0") == "rgba(0,255,0,1)", "short hex color");
    Check(ToRGBAString("#ff000080", 0.25f) == "rgba(255,0,0,0.25)", "opacity replaces hex alpha");
    Check(ToRGBAString("rgba(0, 0, 255, 0.5)") == "rgba(0,0,255,0.5)", "rgba() keeps its alpha");
    Check(ToRGBAString("rgb(100%, 0%, 0%)") == "rgba(255,0,0,1)", "rgb() percentages");
    Check(ToRGBAString("hsl(120, 100%, 50%)") == "rgba(0,255,0,1)", "hsl() converts to rgb");
    Check(ToRGBAString("hsv(240, 100%, 100%)") == "rgba(0,0,255,1)", "hsv() converts to rgb");
    Check(ToRGBAString("r\xE9" "d") == "rgba(0,0,0,1)", "non-ascii color names fall back to black");
    Check(ToRGBAString("transparent") == "rgba(0,0,0,0)", "transparent");
    Check(ToRGBAString("none", 0.5f) == "none", "none ignores opacity");
    Check(ToRGBAString("not-a-color") == "rgba(0,0,0,1)", "unknown color falls back to black");

    RenderConfig config;
    StyleDescriptor style;
    style.fillColor = "rgba(255,0,0,0.2)";
    style.fillOpacity = 0.7f;
    auto resolved = ResolveStyle(style, config);
    Check(resolved.fill.has_value() && resolved.fill->a == 0.7f, "fill opacity overrides embedded alpha");
    Check(!resolved.stroke.has_value() && !resolved.HasStroke(), "no line color means no stroke");
    Check(resolved.lineWidth == 1.f && resolved.lineJoin == LineJoin::Round && resolved.lineCap == LineCap::Butt,
        "style defaults are width 1, round join, butt cap");

    auto zeroWidth = ResolveStyle(StyleDescriptor{}.WithLine("black", 0.f), config);
    Check(!zeroWidth.HasStroke(), "zero line width disables stroke");

    Check(Throws<InvalidArgument>([&] { (void)ResolveStyle(StyleDescriptor{}.WithLine("black", -1.f), config); }),
        "negative line width is rejected");
    Check(Throws<InvalidArgument>([&] { (void)ResolveStyle(StyleDescriptor{}.WithFill("red", 1.5f), config); }),
        "opacity above 1 is rejected");
    Check(Throws<InvalidArgument>([&] { (void)ResolveStyle(StyleDescriptor{}.WithFill("red", NAN), config); }),
        "non-finite opacity is rejected");
    Check(Throws<InvalidArgument>([] { (void)ParseLineJoin("zigzag"); }), "unknown line join is rejected");
    Check(ParseLineCap("square") == LineCap::Square && ParseLineJoin("Miter") == LineJoin::Miter, "join/cap names parse");
}

static void TestVectorBackend()
{
    RenderConfig config;
    auto renderer = CreateSVGRenderer(config);
    auto style = StyleDescriptor{}.WithFill("red").WithLine("black", 2.f);

    TestScenarioBuilder builder{ *renderer };
    auto circle = builder.Create("vector circle attributes").Circle({ 50.f, 50.f }, 10.f, style)
        .AssertNodeCount(1)
        .AssertAttribute(0, "cx", "50").AssertAttribute(0, "cy", "50").AssertAttribute(0, "r", "10")
        .AssertAttribute(0, "fill", "rgba(255,0,0,1)").AssertAttribute(0, "stroke", "rgba(0,0,0,1)")
        .AssertAttribute(0, "stroke-width", "2").AssertAttribute(0, "stroke-linejoin", "round")
        .AssertAttribute(0, "stroke-linecap", "butt").Done();
    Check(circle);

    auto shapes = builder.Create("vector shape geometry")
        .Ellipse({ 20.f, 30.f }, 5.f, 2.5f)
        .Rect({ 1.f, 2.f }, { 3.f, 4.f })
        .Line({ 0.f, 0.f }, { 10.f, 0.5f })
        .Polyline({ 0.f, 0.f, 10.f, 10.f, 20.f, 0.f })
        .Polygon({ 0.f, 0.f, 10.f, 0.f, 10.f, 10.f })
        .AssertNodeCount(5)
        .AssertAttribute(0, "rx", "5").AssertAttribute(0, "ry", "2.5")
        .AssertAttribute(1, "width", "3").AssertAttribute(1, "height", "4")
        .AssertAttribute(2, "y2", "0.5")
        .AssertAttribute(3, "points", "0 0,10 10,20 0")
        .AssertAttribute(4, "points", "0 0,10 0,10 10")
        .AssertAttribute(4, "fill", "none").AssertAttribute(4, "stroke", "none")
        .AssertAttribute(4, "stroke-width", "1").Done();
    Check(shapes);

    auto odd = builder.Create("vector odd coordinates").Polyline({ 0.f, 0.f, 10.f }).Throws()
        .Polygon({ 1.f }).Throws().AssertNodeCount(0).Done();
    Check(odd);

    auto opacity = builder.Create("vector opacity override")
        .Rect({ 0.f, 0.f }, { 10.f, 10.f }, StyleDescriptor{}.WithFill("rgba(255,0,0,0.2)", 0.7f).WithLine("#0000ff", 1.f, 0.25f))
        .AssertAttribute(0, "fill", "rgba(255,0,0,0.7)").AssertAttribute(0, "stroke", "rgba(0,0,255,0.25)").Done();
    Check(opacity);

    auto empty = builder.Create("vector empty coordinate list draws nothing").Polyline({}).AssertNodeCount(0).Done();
    Check(empty);

    auto rasterized = builder.Create("vector surface rasterizes through lunasvg")
        .Rect({ 0.f, 0.f }, { 10.f, 10.f }, StyleDescriptor{}.WithFill("blue"))
        .AssertPixel({ 5.f, 5.f }, ToRGBA(0, 0, 255), 1).AssertPixel({ 50.f, 50.f }, 0u).Done();
    Check(rasterized);

    // Clear, then replaying the same draws reproduces the node set
    auto replay = builder.Create("vector clear and replay")
        .Circle({ 10.f, 10.f }, 5.f, style).Polygon({ 0.f, 0.f, 5.f, 5.f, 0.f, 5.f }, style).Done();
    Check(replay);
    auto& svg = *dynamic_cast<SVGSurface*>(replay.surface.get());
    auto before = svg.Markup();
    renderer->Clear(svg);
    Check(svg.Root()->ChildCount() == 0, "vector clear removes every node");
    replay.Replay();
    Check(svg.Markup() == before, "vector replay after clear reproduces the markup");
    renderer->Empty(svg);
    Check(svg.Root()->ChildCount() == 0, "vector empty removes every node");
}

static void TestShapeHandles()
{
    RenderConfig config;
    auto renderer = CreateSVGRenderer(config);
    auto surface = renderer->GetCanvas({ 100.f, 100.f });
    auto& svg = *dynamic_cast<SVGSurface*>(surface.get());

    Check(svg.Root()->Style("position") == "absolute", "vector surface is absolutely positioned");
    Check(svg.Root()->Attribute("width") == "100", "vector surface carries its width");

    auto first = renderer->DrawCircle(surface->Context(), { 10.f, 10.f }, 5.f);
    auto second = renderer->DrawRect(surface->Context(), { 0.f, 0.f }, { 5.f, 5.f });
    Check((bool)first && (bool)second, "vector draws return live handles");
    Check(svg.Root()->children.back() == second.Element(), "later draws are appended last");

    Check(first.SetStyle(StyleDescriptor{}.WithFill("green")), "restyling a live handle");
    Check(first.Attribute("fill") == "rgba(0,128,0,1)", "restyle rewrites the fill");

    Check(first.Remove(), "removing through a handle");
    Check(!first && svg.Root()->ChildCount() == 1, "removed handle expires");

    renderer->Clear(*surface);
    Check(!second, "clear expires outstanding handles");

    auto& group = renderer->GetContext(*surface);
    renderer->DrawLine(group, { 0.f, 0.f }, { 1.f, 1.f });
    Check(svg.Root()->ChildCount() == 1 && svg.Root()->children[0]->name == "g" &&
        svg.Root()->children[0]->ChildCount() == 1, "draws into a group context nest under it");

    renderer->Clear(*surface);
    Check(Throws<InvalidArgument>([&] { renderer->DrawLine(group, { 0.f, 0.f }, { 1.f, 1.f }); }),
        "group contexts detached by clear reject draws");
    Check(svg.Root()->ChildCount() == 0, "rejected draws leave the cleared surface empty");

    for (auto frame = 0; frame < 10; ++frame)
    {
        renderer->Clear(*surface);
        auto& fresh = renderer->GetContext(*surface);
        renderer->DrawCircle(fresh, { 5.f, 5.f }, 1.f);
    }
    Check(svg.contexts.size() == 1 && svg.Root()->ChildCount() == 1, "clear and redraw loops reuse context slots");

    auto raster = CreateRasterRenderer(config);
    auto pixels = raster->GetCanvas({ 10.f, 10.f });
    Check(pixels != nullptr, "raster surface is created");
    if (pixels)
    {
        Check(!raster->DrawCircle(pixels->Context(), { 5.f, 5.f }, 2.f), "raster draws return empty handles");
        Check(Throws<InvalidArgument>([&] { renderer->DrawCircle(pixels->Context(), { 5.f, 5.f }, 2.f); }),
            "vector renderer rejects a raster context");
        Check(Throws<InvalidArgument>([&] { raster->DrawCircle(surface->Context(), { 5.f, 5.f }, 2.f); }),
            "raster renderer rejects a vector context");
        Check(Throws<InvalidArgument>([&] { (void)raster->GetContext(*pixels, "webgl"); }),
            "raster surfaces only provide a 2d context");
        Check(&raster->GetContext(*pixels, "2d") == &pixels->Context(), "2d context is the surface context");
    }
}

static void TestRasterBackend()
{
    RenderConfig config;
    auto renderer = CreateRasterRenderer(config);
    auto blue = ToRGBA(0, 0, 255);

    TestScenarioBuilder builder{ *renderer };
    auto square = builder.Create("raster blue polygon")
        .Polygon({ 0.f, 0.f, 10.f, 0.f, 10.f, 10.f, 0.f, 10.f }, StyleDescriptor{}.WithFill("blue"))
        .AssertPixel({ 5.f, 5.f }, blue).AssertPixel({ 0.f, 0.f }, blue, 1).AssertPixel({ 9.f, 9.f }, blue, 1)
        .AssertPixel({ 15.f, 15.f }, 0u).AssertPixel({ 10.f, 5.f }, 0u, 1).Done();
    Check(square);

    auto odd = builder.Create("raster odd coordinates")
        .Polygon({ 0.f, 0.f, 10.f }, StyleDescriptor{}.WithFill("blue")).Throws()
        .Polyline({ 0.f, 0.f, 10.f, 10.f, 20.f }, StyleDescriptor{}.WithLine("blue", 4.f)).Throws()
        .AssertPixel({ 1.f, 1.f }, 0u).AssertPixel({ 5.f, 5.f }, 0u).Done();
    Check(odd);

    auto opacity = builder.Create("raster fill opacity")
        .Rect({ 0.f, 0.f }, { 20.f, 20.f }, StyleDescriptor{}.WithFill("#0000ffff", 0.5f))
        .AssertPixel({ 10.f, 10.f }, ToRGBA(0, 0, 255, 128), 2).Done();
    Check(opacity);

    auto stroke = builder.Create("raster stroke without fill")
        .Line({ 0.f, 50.f }, { 100.f, 50.f }, StyleDescriptor{}.WithLine("red", 4.f))
        .Rect({ 20.f, 20.f }, { 10.f, 10.f }, StyleDescriptor{}.WithLine("red", 0.f))
        .AssertPixel({ 50.f, 50.f }, ToRGBA(255, 0, 0), 1)
        .AssertPixel({ 50.f, 40.f }, 0u)
        .AssertPixel({ 20.f, 25.f }, 0u).Done();
    Check(stroke);

    auto zeroWidth = builder.Create("raster zero line width keeps the fill")
        .Rect({ 20.f, 20.f }, { 10.f, 10.f }, StyleDescriptor{}.WithFill("blue").WithLine("red", 0.f))
        .AssertPixel({ 25.f, 25.f }, blue).AssertPixel({ 20.f, 25.f }, blue, 1)
        .AssertPixel({ 19.f, 25.f }, 0u).Done();
    Check(zeroWidth);

    // The 4px stroke straddles the rect edge at x = 10, so pixel 10 is covered by both paints
    auto order = builder.Create("raster stroke paints over fill")
        .Rect({ 10.f, 10.f }, { 20.f, 20.f }, StyleDescriptor{}.WithFill("blue").WithLine("red", 4.f))
        .AssertPixel({ 10.f, 20.f }, ToRGBA(255, 0, 0), 1)
        .AssertPixel({ 8.f, 20.f }, ToRGBA(255, 0, 0), 1)
        .AssertPixel({ 20.f, 20.f }, blue).Done();
    Check(order);

    auto replay = builder.Create("raster clear and replay")
        .Circle({ 30.f, 30.f }, 12.f, StyleDescriptor{}.WithFill("orange").WithLine("black", 2.f))
        .Ellipse({ 60.f, 40.f }, 20.f, 8.f, StyleDescriptor{}.WithFill("rgba(0,128,0,0.5)"))
        .Polyline({ 0.f, 90.f, 40.f, 60.f, 90.f, 95.f }, StyleDescriptor{}.WithLine("navy", 3.f)).Done();
    Check(replay);
    auto& pixels = *dynamic_cast<RasterSurface*>(replay.surface.get());
    auto before = pixels.Snapshot();
    renderer->Clear(pixels);

    auto cleared = pixels.Snapshot();
    Check(std::all_of(cleared.pixels.begin(), cleared.pixels.end(), [](uint32_t p) { return p == 0u; }),
        "raster clear erases the whole surface");
    replay.Replay();
    Check(pixels.Snapshot().pixels == before.pixels, "raster replay after clear reproduces the pixels");
}

static void TestEllipseGeometry()
{
    auto path = EllipseBezierSegments({ 50.f, 50.f }, 10.f, 10.f);
    auto offset = 10.f * 0.5522848f;

    Check(Near(path.start, { 40.f, 50.f }), "ellipse starts at the left-most point");
    Check(Near(path.segments[0].control1, { 40.f, 50.f - offset }) && Near(path.segments[0].control2, { 50.f - offset, 40.f }) &&
        Near(path.segments[0].end, { 50.f, 40.f }), "first ellipse segment runs to the top");
    Check(Near(path.segments[1].end, { 60.f, 50.f }) && Near(path.segments[2].end, { 50.f, 60.f }) &&
        Near(path.segments[3].end, { 40.f, 50.f }), "ellipse segments end at the cardinal points");

    auto wide = EllipseBezierSegments({ 0.f, 0.f }, 20.f, 5.f);
    Check(Near(wide.segments[1].control1, { 20.f * 0.5522848f, -5.f }) && Near(wide.segments[1].control2, { 20.f, -5.f * 0.5522848f }),
        "control offsets scale with each radius");

    RenderConfig config;
    auto renderer = CreateRasterRenderer(config);
    auto circle = renderer->GetCanvas({ 64.f, 64.f });
    auto ellipse = renderer->GetCanvas({ 64.f, 64.f });
    Check(circle && ellipse, "raster surfaces for ellipse comparison");
    if (!circle || !ellipse) return;

    renderer->DrawCircle(circle->Context(), { 32.f, 32.f }, 20.f, StyleDescriptor{}.WithFill("black"));
    renderer->DrawEllipse(ellipse->Context(), { 32.f, 32.f }, 20.f, 20.f, StyleDescriptor{}.WithFill("black"));

    auto lhs = circle->Rasterize(), rhs = ellipse->Rasterize();
    auto maxDiff = 0;
    for (auto y = 0; y < lhs.height; ++y)
        for (auto x = 0; x < lhs.width; ++x)
        {
            auto [lr, lg, lb, la] = DecomposeColor(lhs.PixelAt(x, y));
            auto [rr, rg, rb, ra] = DecomposeColor(rhs.PixelAt(x, y));
            maxDiff = std::max(maxDiff, std::abs(la - ra));
        }

    Check(maxDiff <= 8, "ellipse with equal radii matches the circle within tolerance");
}

static void TestBackendSelection()
{
    TestEnvironment both{ true, true };
    RenderConfig config;
    config.environment = &both;

    RenderContext context{ config };
    Check(!context.IsResolved(), "selection starts untested");
    Check(context.SelectedBackend() == BackendType::SVG, "vector is preferred when both are supported");
    Check(context.SelectedBackend() == BackendType::SVG && both.featureQueries == 1 && both.contextQueries == 0,
        "selection is probed once and cached");
    Check(context.Renderer().Type() == BackendType::SVG, "selected renderer matches the selection");

    auto svg = CreateSVGRenderer(config);
    Check(svg->IsSupported() == svg->IsSupported(), "IsSupported is stable across calls");

    TestEnvironment rasterOnly{ false, true };
    config.environment = &rasterOnly;
    RenderContext fallback{ config };
    Check(fallback.SelectedBackend() == BackendType::Raster, "raster is selected when vector is unsupported");

    TestEnvironment neither{ false, false };
    config.environment = &neither;
    RenderContext unsupported{ config };
    Check(unsupported.SelectedBackend() == BackendType::None, "no backend is selected when neither is supported");
    Check(!unsupported.Renderer().IsSupported(), "null renderer reports unsupported");

    TestScenarioBuilder builder{ unsupported.Renderer() };
    auto failing = builder.Create("unsupported backend fails every draw")
        .Circle({ 1.f, 1.f }, 1.f).FailsUnconfigured()
        .Polygon({ 0.f, 0.f, 1.f, 1.f }).FailsUnconfigured()
        .Clear().FailsUnconfigured().Done();
    Check(failing);

    auto message = std::string{};
    try
    {
        (void)unsupported.Renderer().GetCanvas({ 10.f, 10.f });
    }
    catch (const ConfigurationError& ex)
    {
        message = ex.what();
    }
    Check(message == "no supported rendering backend", "configuration error names the missing backend");

    RenderContext host{};
    auto selected = host.SelectedBackend();
    Check(selected == BackendType::SVG || selected == BackendType::Raster, "host environment supports a backend");
}

static bool RunScheduledFrame(ImVec2, IPlatform& platform, void* data)
{
    auto scheduler = (FrameScheduler*)data;
    scheduler->DispatchFrame(platform.Now());
    return true;
}

static void TestFrameScheduler()
{
    TestPlatform platform{};
    platform.clock = 100.0;

    FrameScheduler scheduler{ &platform, 16 };
    Check(scheduler.UsesTimerFallback(), "timer fallback without a frame driving platform");

    std::vector<std::pair<int, double>> calls;
    auto first = scheduler.RequestFrame([&](double ts) { calls.emplace_back(1, ts); });
    platform.Advance(5.0);
    auto second = scheduler.RequestFrame([&](double ts) { calls.emplace_back(2, ts); });
    Check(first != second && scheduler.Pending() == 2, "each request gets its own id");

    Check(scheduler.Poll() == 1, "only due callbacks run");
    Check(calls.size() == 1 && calls[0].first == 1 && calls[0].second == 100.0, "first callback is due immediately");

    platform.Advance(11.0);
    Check(scheduler.Poll() == 1 && calls.size() == 2 && calls[1].second == 116.0, "next callback waits out the frame interval");

    auto cancelled = scheduler.RequestFrame([&](double ts) { calls.emplace_back(3, ts); });
    Check(scheduler.CancelFrame(cancelled), "pending callback can be cancelled");
    platform.Advance(100.0);
    Check(scheduler.Poll() == 0 && calls.size() == 2, "cancelled callbacks never run");
    Check(!scheduler.CancelFrame(cancelled), "cancelling twice is a no-op");

    std::vector<int> order;
    platform.drivesFrames = true;
    Check(!scheduler.UsesTimerFallback(), "platform driven frames");

    int32_t sibling = 0;
    scheduler.RequestFrame([&](double) {
        order.push_back(1);
        scheduler.CancelFrame(sibling);
        scheduler.RequestFrame([&](double) { order.push_back(3); });
    });
    sibling = scheduler.RequestFrame([&](double) { order.push_back(2); });

    platform.QueueFrames(1);
    platform.PollEvents(&RunScheduledFrame, &scheduler);
    Check(order.size() == 1 && order[0] == 1, "one dispatch per frame, cancelled siblings are skipped");
    Check(scheduler.Pending() == 1, "callbacks requested during a frame wait for the next");

    platform.QueueFrames(1);
    platform.PollEvents(&RunScheduledFrame, &scheduler);
    Check(order.size() == 2 && order[1] == 3 && platform.frameCount == 2, "next frame runs the deferred callback");

    std::vector<int> afterThrow;
    scheduler.RequestFrame([](double) { throw std::runtime_error{ "frame failed" }; });
    auto survivor = scheduler.RequestFrame([&](double) { afterThrow.push_back(1); });
    scheduler.RequestFrame([&](double) { afterThrow.push_back(2); });
    Check(scheduler.CancelFrame(survivor), "cancel before the failing frame");

    Check(Throws<std::runtime_error>([&] { scheduler.DispatchFrame(platform.Now()); }),
        "exceptions from frame callbacks propagate");
    Check(!scheduler.CancelFrame(12345), "unknown ids are not found after a failed frame");
    Check(scheduler.Pending() == 1 && afterThrow.empty(), "callbacks after the failing one are kept pending");
    Check(scheduler.DispatchFrame(platform.Now()) == 1 && afterThrow.size() == 1 && afterThrow[0] == 2,
        "kept callbacks run on the next frame");
}

static void TestContainer()
{
    TestPlatform platform{ { 800.f, 600.f } };
    platform.scroll = { 0.f, 5.f };

    TestEnvironment rasterOnly{ false, true };
    RenderConfig config;
    config.environment = &rasterOnly;
    config.platform = &platform;

    RenderContext context{ config };
    Container container{ context, { 20.f, 20.f }, { 10.f, 20.f } };

    auto bottom = container.AddSurface();
    auto top = container.AddSurface();
    Check(bottom != nullptr && top != nullptr && container.SurfaceCount() == 2, "surfaces are stacked in the container");
    if (bottom == nullptr || top == nullptr) return;

    Check(container.LayerStyle(top, "position") == "absolute" && container.LayerStyle(top, "left") == "0" &&
        container.LayerStyle(top, "top") == "0", "layers are absolutely positioned at the origin");

    auto& renderer = context.Renderer();
    renderer.DrawRect(bottom->Context(), { 0.f, 0.f }, { 20.f, 20.f }, StyleDescriptor{}.WithFill("red"));
    renderer.DrawRect(top->Context(), { 0.f, 0.f }, { 10.f, 20.f }, StyleDescriptor{}.WithFill("blue"));

    auto composite = container.Composite();
    Check(composite.PixelAt(5, 5) == ToRGBA(0, 0, 255) && composite.PixelAt(15, 5) == ToRGBA(255, 0, 0),
        "later surfaces paint over earlier ones");

    container.SetOpacity(top, 0.5f);
    composite = container.Composite();
    auto [r, g, b, a] = DecomposeColor(composite.PixelAt(5, 5));
    Check(std::abs(r - 128) <= 1 && g == 0 && std::abs(b - 128) <= 1 && a == 255, "layer opacity blends source-over");

    container.Hide(top);
    Check(!container.IsVisible(top) && container.Composite().PixelAt(5, 5) == ToRGBA(255, 0, 0), "hidden layers are skipped");
    container.Show(top);
    Check(container.IsVisible(top), "shown layers are visible again");

    Check(container.RemoveSurface(top) && container.SurfaceCount() == 1, "surfaces can be removed");

    auto bounds = container.Bounds();
    Check(Near(bounds.Min, { 10.f, 15.f }) && Near(bounds.Max, { 30.f, 35.f }), "bounds are relative to the scrolled viewport");
    Check(Near(container.ViewportSize(), { 800.f, 600.f }) && Near(container.PageOffset(), { 0.f, 5.f }),
        "viewport size and page offset come from the platform");

    auto overflow = container.IsRectInViewport(ImRect{ { -5.f, 10.f }, { 100.f, 610.f } });
    Check(overflow.left == 5.f && overflow.bottom == 10.f && overflow.top == 0.f && overflow.right == 0.f,
        "per-edge overflow outside the viewport");
    overflow = container.IsRectInViewport(ImRect{ { 10.f, 10.f }, { 795.f, 100.f } }, 10.f);
    Check(overflow.left == 0.f && overflow.top == 0.f && overflow.right == 5.f, "margin expands the tested rect");

    auto presses = 0, releases = 0;
    auto id = container.On("mousedown  mouseup", [&](const HostEvent& event) {
        if (event.type == "mousedown") presses++;
        else releases++;
    });
    container.AttachTo(platform);

    platform.PushMouseEvent("mousedown", { 1.f, 1.f });
    platform.PushMouseEvent("mouseup", { 1.f, 1.f });
    platform.PushMouseEvent("click", { 1.f, 1.f });
    Check(platform.DeliverEvents() == 3 && presses == 1 && releases == 1, "listener receives each subscribed type");

    Check(container.Off("mousedown", id), "listener removed for one type");
    platform.PushMouseEvent("mousedown", { 1.f, 1.f });
    platform.PushMouseEvent("mouseup", { 1.f, 1.f });
    platform.DeliverEvents();
    Check(presses == 1 && releases == 2, "other subscriptions survive off()");
    Check(container.Dispatch("mouseup", HostEvent{}) == 1, "dispatch reports notified listeners");
}

static void TestVectorContainer()
{
    TestEnvironment both{ true, true };
    RenderConfig config;
    config.environment = &both;

    RenderContext context{ config };
    Container container{ context, { 40.f, 40.f } };
    auto surface = container.AddSurface();
    Check(surface != nullptr && surface->Backend() == BackendType::SVG, "container uses the selected vector backend");
    if (surface == nullptr) return;

    container.SetOpacity(surface, 0.25f);
    container.Hide(surface);
    auto root = dynamic_cast<SVGSurface*>(surface)->Root();
    Check(root->Style("opacity") == "0.25" && !root->IsVisible(), "layer style is mirrored on the svg root");

    Bitmap negative{ -10, 10 };
    Check(negative.empty() && negative.width == 0 && negative.pixels.empty(), "negative bitmap sizes clamp to empty");
    Check(context.Renderer().GetCanvas({ -10.f, 10.f }) == nullptr, "vector canvas rejects a negative size");

    Container degenerate{ context, { -10.f, 10.f } };
    Check(degenerate.AddSurface() == nullptr, "degenerate container gets no surfaces");
    Check(degenerate.Composite().empty(), "degenerate container composites to an empty bitmap");
}

static void TestDrawLog()
{
    DrawLogger logger;
    RenderConfig config;
    config.logger = &logger;

    auto renderer = CreateSVGRenderer(config);
    auto surface = renderer->GetCanvas({ 10.f, 10.f });
    renderer->DrawCircle(surface->Context(), { 5.f, 5.f }, 2.f, StyleDescriptor{}.WithFill("red"));
    auto before = logger.Records();

    float coords[] = { 0.f, 0.f, 4.f, 4.f };
    renderer->DrawPolyline(surface->Context(), coords, StyleDescriptor{}.WithLine("black", 1.f));
    renderer->Clear(*surface);

    Check(logger.Count() == 3 && logger.Count("circle") == 1 && logger.Count("clear") == 1, "draw calls are logged");
    Check(logger.Records()[0]["style"]["fill"] == "rgba(255,0,0,1)" && logger.Records()[0]["backend"] == "svg",
        "log records carry the resolved style");
    Check(logger.Diff(before).size() == 2, "diff lists the records added since the snapshot");
}

int main(int argc, char** argv)
{
    std::vector<std::pair<std::string_view, std::function<void()>>> suites{
        { "color resolution", TestColorResolution },
        { "vector backend", TestVectorBackend },
        { "shape handles", TestShapeHandles },
        { "raster backend", TestRasterBackend },
        { "ellipse geometry", TestEllipseGeometry },
        { "backend selection", TestBackendSelection },
        { "frame scheduler", TestFrameScheduler },
        { "container", TestContainer },
        { "vector container", TestVectorContainer },
        { "draw log", TestDrawLog },
    };

    for (const auto& [name, suite] : suites)
    {
        auto failed = Failures.size();
        suite();
        std::fprintf(stdout, "%s %.*s\n", Failures.size() == failed ? "[ OK ]" : "[FAIL]", (int)name.size(), name.data());
    }

    std::fprintf(stdout, "%d failure(s)\n", (int)Failures.size());
    return Failures.empty() ? 0 : 1;
}
