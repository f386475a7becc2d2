/*
Testing of charts drawn with vellum can be done using TestEnvironment, TestPlatform,
DrawLogger and TestScenarioBuilder.

TestEnvironment scripts the answers of the capability probe, so backend selection can be
exercised for every combination of supported backends. TestPlatform is a dummy platform
with a manual clock, a scripted viewport/scroll offset and an event queue which is
delivered to registered handlers (e.g. a Container) when frames are run.

DrawLogger records every draw call reported by the renderers as JSON data. Records can be
dumped to a file, and two snapshots can be compared as a JSON patch.

An example test-case:

    TestScenarioBuilder builder{ renderer };
    auto scenario = builder.Create("vector circle").Circle({ 50, 50 }, 10, style)
        .AssertAttribute(0, "cx", "50").AssertNodeCount(1).Done();
    scenario.Run();

*/

#pragma once

#ifdef VELLUM_ENABLE_TESTING

#include <deque>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "context.h"
#include "platform.h"
#include "surface.h"

namespace vellum
{
    struct TestEnvironment final : public IEnvironment
    {
        bool svgSupported = true;
        bool rasterSupported = true;
        int featureQueries = 0;
        int contextQueries = 0;

        TestEnvironment(bool svg, bool raster) : svgSupported{ svg }, rasterSupported{ raster } {}

        bool HasFeature(std::string_view feature, std::string_view version) override;
        bool CanCreateContext(std::string_view type) override;
    };

    struct TestPlatform final : public IPlatform
    {
        explicit TestPlatform(ImVec2 viewport = ImVec2{ 800.f, 600.f });

        bool CreateWindow(const WindowParams& params) override;

        // Runs the frames queued by QueueFrames(), advancing the clock by frameMs and
        // delivering pending events before each runner call
        bool PollEvents(bool (*runner)(ImVec2, IPlatform&, void*), void* data) override;
        void PushEventHandler(HostEventHandlerT callback, void* data) override;
        void RemoveEventHandler(void* data) override;

        ImVec2 ViewportSize() const override { return viewport; }
        ImVec2 ScrollOffset() const override { return scroll; }
        bool DrivesFrames() const override { return drivesFrames; }
        double Now() const override { return clock; }

        // Test APIs
        void PushEvent(const HostEvent& event);
        void PushMouseEvent(std::string_view type, ImVec2 pos, MouseButton button = MouseButton::LeftMouseButton);
        int DeliverEvents();
        void QueueFrames(int count = 1);
        void Advance(double ms) { clock += ms; }

        WindowParams window;
        ImVec2 viewport;
        ImVec2 scroll;
        double clock = 0.0;
        double frameMs = VELLUM_FRAME_INTERVAL_MS;
        bool drivesFrames = false;
        int framesToRun = 0;
        std::deque<HostEvent> events;
        std::vector<std::pair<void*, HostEventHandlerT>> handlers;
    };

    struct DrawLogger final : public IDrawLogger
    {
        void Log(BackendType backend, std::string_view op, std::span<const float> geometry, const ResolvedStyle& style) override;
        void Log(BackendType backend, std::string_view op) override;

        [[nodiscard]] int Count(std::string_view op = {}) const;
        [[nodiscard]] const nlohmann::json& Records() const { return records; }

        // JSON patch turning before into the current records
        [[nodiscard]] nlohmann::json Diff(const nlohmann::json& before) const;
        bool Dump(std::string_view path) const;
        void Reset() { records = nlohmann::json::array(); }

        nlohmann::json records = nlohmann::json::array();
    };

    struct TestScenario
    {
        enum class ActionType { Circle, Ellipse, Rect, Line, Polyline, Polygon, Clear, Empty };
        enum class Expectation { Success, InvalidArgument, ConfigurationError };

        struct Action
        {
            ActionType type;
            std::vector<float> geometry;
            StyleDescriptor style;
            Expectation expect = Expectation::Success;
        };

        enum class AssertType { Attribute, NodeCount, Pixel };

        struct Assertion
        {
            AssertType type;
            int node = -1;
            std::string prop;
            std::string s_val;
            int64_t i_val = 0;
            ImVec2 pos;
            uint32_t color = 0;
            int tolerance = 0;
        };

        IRenderer* renderer = nullptr;
        ImVec2 size{ 100.f, 100.f };
        std::string name;
        std::vector<Action> actions;
        std::vector<Assertion> assertions;
        std::vector<std::string> failures;
        std::unique_ptr<ISurface> surface;

        // Creates a fresh surface, replays the actions on it and evaluates assertions.
        // The surface stays alive afterwards for further inspection.
        bool Run();
        bool Replay();
    };

    struct TestScenarioBuilder
    {
        TestScenario scenario;

        explicit TestScenarioBuilder(IRenderer& renderer, ImVec2 size = ImVec2{ 100.f, 100.f });

        TestScenarioBuilder& Create(std::string_view name);

        TestScenarioBuilder& Circle(ImVec2 center, float radius, const StyleDescriptor& style = {});
        TestScenarioBuilder& Ellipse(ImVec2 center, float rx, float ry, const StyleDescriptor& style = {});
        TestScenarioBuilder& Rect(ImVec2 pos, ImVec2 size, const StyleDescriptor& style = {});
        TestScenarioBuilder& Line(ImVec2 startpos, ImVec2 endpos, const StyleDescriptor& style = {});
        TestScenarioBuilder& Polyline(std::vector<float> coords, const StyleDescriptor& style = {});
        TestScenarioBuilder& Polygon(std::vector<float> coords, const StyleDescriptor& style = {});
        TestScenarioBuilder& Clear();
        TestScenarioBuilder& Empty();

        // Expectation for the last added action
        TestScenarioBuilder& Throws();
        TestScenarioBuilder& FailsUnconfigured();

        TestScenarioBuilder& AssertAttribute(int node, std::string_view prop, std::string_view value);
        TestScenarioBuilder& AssertNodeCount(int64_t count);
        TestScenarioBuilder& AssertPixel(ImVec2 pos, uint32_t rgba, int tolerance = 0);

        TestScenario Done();
    };
}

#endif
