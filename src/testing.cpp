#include "testing.h"

#ifdef VELLUM_ENABLE_TESTING

#include <cstdlib>
#include <fstream>

#include "style.h"

namespace vellum
{
    using json = nlohmann::json;

#pragma region TestEnvironment implementation

    bool TestEnvironment::HasFeature(std::string_view feature, std::string_view version)
    {
        featureQueries++;
        return svgSupported && feature == VELLUM_SVG_FEATURE_SHAPE && version == VELLUM_SVG_FEATURE_VERSION;
    }

    bool TestEnvironment::CanCreateContext(std::string_view type)
    {
        contextQueries++;
        return rasterSupported && type == VELLUM_RASTER_CONTEXT_TYPE;
    }

#pragma endregion

#pragma region TestPlatform implementation

    TestPlatform::TestPlatform(ImVec2 size)
        : viewport{ size }
    {
        window.size = size;
    }

    bool TestPlatform::CreateWindow(const WindowParams& params)
    {
        window = params;
        viewport = params.size;
        return true;
    }

    bool TestPlatform::PollEvents(bool (*runner)(ImVec2, IPlatform&, void*), void* data)
    {
        while (framesToRun > 0)
        {
            framesToRun--;
            clock += frameMs;
            DeliverEvents();

            auto proceed = runner(viewport, *this, data);
            frameCount++;

            if (!proceed)
            {
                framesToRun = 0;
                return false;
            }
        }

        return true;
    }

    void TestPlatform::PushEventHandler(HostEventHandlerT callback, void* data)
    {
        handlers.emplace_back(data, callback);
    }

    void TestPlatform::RemoveEventHandler(void* data)
    {
        handlers.erase(std::remove_if(handlers.begin(), handlers.end(),
            [data](const auto& entry) { return entry.first == data; }), handlers.end());
    }

    void TestPlatform::PushEvent(const HostEvent& event)
    {
        events.push_back(event);
    }

    void TestPlatform::PushMouseEvent(std::string_view type, ImVec2 pos, MouseButton button)
    {
        HostEvent event;
        event.type = type;
        event.pos = pos;
        event.button = button;
        events.push_back(event);
    }

    int TestPlatform::DeliverEvents()
    {
        auto delivered = 0;

        while (!events.empty())
        {
            auto event = events.front();
            events.pop_front();

            if (event.type == "resize")
                viewport = event.pos;

            auto current = handlers;
            for (auto [data, handler] : current)
                handler(data, event);
            delivered++;
        }

        return delivered;
    }

    void TestPlatform::QueueFrames(int count)
    {
        framesToRun += std::max(count, 0);
    }

#pragma endregion

#pragma region DrawLogger implementation

    static json StyleToJson(const ResolvedStyle& style)
    {
        json result = json::object();
        result["fill"] = style.fill.has_value() ? json(ToRGBAString(*style.fill)) : json(nullptr);
        result["stroke"] = style.stroke.has_value() ? json(ToRGBAString(*style.stroke)) : json(nullptr);
        result["lineWidth"] = style.lineWidth;
        result["lineJoin"] = std::string{ ToString(style.lineJoin) };
        result["lineCap"] = std::string{ ToString(style.lineCap) };
        return result;
    }

    void DrawLogger::Log(BackendType backend, std::string_view op, std::span<const float> geometry, const ResolvedStyle& style)
    {
        json record = json::object();
        record["backend"] = std::string{ ToString(backend) };
        record["op"] = std::string{ op };
        record["geometry"] = std::vector<float>(geometry.begin(), geometry.end());
        record["style"] = StyleToJson(style);
        records.push_back(std::move(record));
    }

    void DrawLogger::Log(BackendType backend, std::string_view op)
    {
        json record = json::object();
        record["backend"] = std::string{ ToString(backend) };
        record["op"] = std::string{ op };
        records.push_back(std::move(record));
    }

    int DrawLogger::Count(std::string_view op) const
    {
        if (op.empty()) return (int)records.size();

        auto count = 0;
        for (const auto& record : records)
            if (record["op"].get<std::string>() == op) count++;
        return count;
    }

    json DrawLogger::Diff(const json& before) const
    {
        return json::diff(before, records);
    }

    bool DrawLogger::Dump(std::string_view path) const
    {
        std::ofstream file{ std::string{ path } };
        if (!file.is_open())
        {
            ERROR("Failed to open %.*s for writing draw log\n", (int)path.size(), path.data());
            return false;
        }

        file << records.dump(2);
        return file.good();
    }

#pragma endregion

#pragma region TestScenario implementation

    // Target handed to renderers when no surface could be created (unsupported backend)
    struct DetachedContext final : public IDrawContext
    {
        BackendType Backend() const override { return BackendType::None; }
    };

    static std::string_view ActionName(TestScenario::ActionType type)
    {
        switch (type)
        {
        case TestScenario::ActionType::Circle: return "circle";
        case TestScenario::ActionType::Ellipse: return "ellipse";
        case TestScenario::ActionType::Rect: return "rect";
        case TestScenario::ActionType::Line: return "line";
        case TestScenario::ActionType::Polyline: return "polyline";
        case TestScenario::ActionType::Polygon: return "polygon";
        case TestScenario::ActionType::Clear: return "clear";
        default: return "empty";
        }
    }

    static void Perform(IRenderer& renderer, ISurface* surface, IDrawContext& target, const TestScenario::Action& action)
    {
        const auto& g = action.geometry;

        switch (action.type)
        {
        case TestScenario::ActionType::Circle:
            renderer.DrawCircle(target, ImVec2{ g[0], g[1] }, g[2], action.style); break;
        case TestScenario::ActionType::Ellipse:
            renderer.DrawEllipse(target, ImVec2{ g[0], g[1] }, g[2], g[3], action.style); break;
        case TestScenario::ActionType::Rect:
            renderer.DrawRect(target, ImVec2{ g[0], g[1] }, ImVec2{ g[2], g[3] }, action.style); break;
        case TestScenario::ActionType::Line:
            renderer.DrawLine(target, ImVec2{ g[0], g[1] }, ImVec2{ g[2], g[3] }, action.style); break;
        case TestScenario::ActionType::Polyline:
            renderer.DrawPolyline(target, g, action.style); break;
        case TestScenario::ActionType::Polygon:
            renderer.DrawPolygon(target, g, action.style); break;
        case TestScenario::ActionType::Clear:
            if (surface == nullptr) throw ConfigurationError{ "no surface to clear" };
            renderer.Clear(*surface); break;
        case TestScenario::ActionType::Empty:
            if (surface == nullptr) throw ConfigurationError{ "no surface to empty" };
            renderer.Empty(*surface); break;
        }
    }

    static std::string Describe(const TestScenario& scenario, int index, std::string_view message)
    {
        std::string result{ scenario.name };
        result.append(" [action #").append(std::to_string(index)).append(" ");
        result.append(ActionName(scenario.actions[index].type)).append("]: ");
        result.append(message);
        return result;
    }

    bool TestScenario::Replay()
    {
        DetachedContext detached;
        auto& target = surface ? surface->Context() : (IDrawContext&)detached;
        auto ok = true;

        for (auto idx = 0; idx < (int)actions.size(); ++idx)
        {
            const auto& action = actions[idx];
            auto outcome = Expectation::Success;
            std::string message;

            try
            {
                Perform(*renderer, surface.get(), target, action);
            }
            catch (const InvalidArgument& ex)
            {
                outcome = Expectation::InvalidArgument;
                message = ex.what();
            }
            catch (const ConfigurationError& ex)
            {
                outcome = Expectation::ConfigurationError;
                message = ex.what();
            }

            if (outcome != action.expect)
            {
                ok = false;
                failures.push_back(Describe(*this, idx, message.empty() ? "expected an exception, none was thrown" :
                    "unexpected exception: " + message));
            }
        }

        return ok;
    }

    static std::shared_ptr<SvgElement> NthNode(ISurface* surface, int index)
    {
        auto svg = dynamic_cast<SVGSurface*>(surface);
        if (svg == nullptr || index < 0 || index >= svg->Root()->ChildCount()) return nullptr;
        return svg->Root()->children[index];
    }

    bool TestScenario::Run()
    {
        failures.clear();
        surface.reset();

        try
        {
            surface = renderer->GetCanvas(size);
        }
        catch (const ConfigurationError& ex)
        {
            LOG("[%s] no surface: %s\n", name.c_str(), ex.what());
        }

        Replay();

        for (const auto& assertion : assertions)
        {
            switch (assertion.type)
            {
            case AssertType::Attribute:
            {
                auto node = NthNode(surface.get(), assertion.node);
                auto value = node ? node->Attribute(assertion.prop) : std::nullopt;

                if (!value.has_value())
                    failures.push_back(name + ": node #" + std::to_string(assertion.node) + " has no attribute " + assertion.prop);
                else if (*value != assertion.s_val)
                    failures.push_back(name + ": " + assertion.prop + " = " + std::string{ *value } + ", expected " + assertion.s_val);
                break;
            }
            case AssertType::NodeCount:
            {
                auto svg = dynamic_cast<SVGSurface*>(surface.get());
                auto count = svg != nullptr ? (int64_t)svg->Root()->ChildCount() : -1;

                if (count != assertion.i_val)
                    failures.push_back(name + ": node count " + std::to_string(count) + ", expected " + std::to_string(assertion.i_val));
                break;
            }
            case AssertType::Pixel:
            {
                if (!surface)
                {
                    failures.push_back(name + ": no surface to read pixels from");
                    break;
                }

                auto bitmap = surface->Rasterize();
                auto actual = DecomposeColor(bitmap.PixelAt((int32_t)assertion.pos.x, (int32_t)assertion.pos.y));
                auto expected = DecomposeColor(assertion.color);
                auto [ar, ag, ab, aa] = actual;
                auto [er, eg, eb, ea] = expected;

                if (std::abs(ar - er) > assertion.tolerance || std::abs(ag - eg) > assertion.tolerance ||
                    std::abs(ab - eb) > assertion.tolerance || std::abs(aa - ea) > assertion.tolerance)
                {
                    char buffer[160];
                    std::snprintf(buffer, sizeof(buffer), ": pixel (%d, %d) = [%d, %d, %d, %d], expected [%d, %d, %d, %d]",
                        (int)assertion.pos.x, (int)assertion.pos.y, ar, ag, ab, aa, er, eg, eb, ea);
                    failures.push_back(name + buffer);
                }
                break;
            }
            }
        }

        for (const auto& failure : failures)
            ERROR("FAILED %s\n", failure.c_str());

        return failures.empty();
    }

    TestScenarioBuilder::TestScenarioBuilder(IRenderer& renderer, ImVec2 size)
    {
        scenario.renderer = &renderer;
        scenario.size = size;
    }

    TestScenarioBuilder& TestScenarioBuilder::Create(std::string_view name)
    {
        auto renderer = scenario.renderer;
        auto size = scenario.size;
        scenario = TestScenario{};
        scenario.renderer = renderer;
        scenario.size = size;
        scenario.name = std::string{ name };
        return *this;
    }

    TestScenarioBuilder& TestScenarioBuilder::Circle(ImVec2 center, float radius, const StyleDescriptor& style)
    {
        scenario.actions.push_back({ TestScenario::ActionType::Circle, { center.x, center.y, radius }, style });
        return *this;
    }

    TestScenarioBuilder& TestScenarioBuilder::Ellipse(ImVec2 center, float rx, float ry, const StyleDescriptor& style)
    {
        scenario.actions.push_back({ TestScenario::ActionType::Ellipse, { center.x, center.y, rx, ry }, style });
        return *this;
    }

    TestScenarioBuilder& TestScenarioBuilder::Rect(ImVec2 pos, ImVec2 size, const StyleDescriptor& style)
    {
        scenario.actions.push_back({ TestScenario::ActionType::Rect, { pos.x, pos.y, size.x, size.y }, style });
        return *this;
    }

    TestScenarioBuilder& TestScenarioBuilder::Line(ImVec2 startpos, ImVec2 endpos, const StyleDescriptor& style)
    {
        scenario.actions.push_back({ TestScenario::ActionType::Line, { startpos.x, startpos.y, endpos.x, endpos.y }, style });
        return *this;
    }

    TestScenarioBuilder& TestScenarioBuilder::Polyline(std::vector<float> coords, const StyleDescriptor& style)
    {
        scenario.actions.push_back({ TestScenario::ActionType::Polyline, std::move(coords), style });
        return *this;
    }

    TestScenarioBuilder& TestScenarioBuilder::Polygon(std::vector<float> coords, const StyleDescriptor& style)
    {
        scenario.actions.push_back({ TestScenario::ActionType::Polygon, std::move(coords), style });
        return *this;
    }

    TestScenarioBuilder& TestScenarioBuilder::Clear()
    {
        scenario.actions.push_back({ TestScenario::ActionType::Clear, {}, {} });
        return *this;
    }

    TestScenarioBuilder& TestScenarioBuilder::Empty()
    {
        scenario.actions.push_back({ TestScenario::ActionType::Empty, {}, {} });
        return *this;
    }

    TestScenarioBuilder& TestScenarioBuilder::Throws()
    {
        if (!scenario.actions.empty())
            scenario.actions.back().expect = TestScenario::Expectation::InvalidArgument;
        return *this;
    }

    TestScenarioBuilder& TestScenarioBuilder::FailsUnconfigured()
    {
        if (!scenario.actions.empty())
            scenario.actions.back().expect = TestScenario::Expectation::ConfigurationError;
        return *this;
    }

    TestScenarioBuilder& TestScenarioBuilder::AssertAttribute(int node, std::string_view prop, std::string_view value)
    {
        TestScenario::Assertion assertion{ TestScenario::AssertType::Attribute };
        assertion.node = node;
        assertion.prop = std::string{ prop };
        assertion.s_val = std::string{ value };
        scenario.assertions.push_back(std::move(assertion));
        return *this;
    }

    TestScenarioBuilder& TestScenarioBuilder::AssertNodeCount(int64_t count)
    {
        TestScenario::Assertion assertion{ TestScenario::AssertType::NodeCount };
        assertion.i_val = count;
        scenario.assertions.push_back(std::move(assertion));
        return *this;
    }

    TestScenarioBuilder& TestScenarioBuilder::AssertPixel(ImVec2 pos, uint32_t rgba, int tolerance)
    {
        TestScenario::Assertion assertion{ TestScenario::AssertType::Pixel };
        assertion.pos = pos;
        assertion.color = rgba;
        assertion.tolerance = tolerance;
        scenario.assertions.push_back(std::move(assertion));
        return *this;
    }

    TestScenario TestScenarioBuilder::Done()
    {
        return std::move(scenario);
    }

#pragma endregion
}

#endif
