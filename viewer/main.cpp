#include "vellum.h"

#include <cmath>
#include <vector>

namespace vellum
{
    struct ViewerState
    {
        Container* container = nullptr;
        IRenderer* renderer = nullptr;
        ISurface* overlay = nullptr;
        RenderContext* context = nullptr;
        double startTime = -1.0;
    };

    static void DrawChart(IRenderer& renderer, ISurface& surface, ImVec2 size)
    {
        auto& chart = renderer.GetContext(surface);
        auto& axes = renderer.GetContext(surface);
        const float margin = 40.f;
        const ImVec2 origin{ margin, size.y - margin };

        StyleDescriptor axis;
        axis = axis.WithLine("#444", 1.5f);
        axis.lineCap = LineCap::Square;
        renderer.DrawLine(axes, origin, ImVec2{ size.x - margin, origin.y }, axis);
        renderer.DrawLine(axes, origin, ImVec2{ origin.x, margin }, axis);
        renderer.DrawRect(chart, ImVec2{ margin, margin }, ImVec2{ size.x - 2.f * margin, size.y - 2.f * margin },
            StyleDescriptor{}.WithFill("steelblue", 0.05f));

        std::vector<float> series;
        const auto step = (size.x - 2.f * margin) / 11.f;
        for (auto idx = 0; idx < 12; ++idx)
        {
            auto x = origin.x + step * (float)idx;
            auto y = origin.y - (size.y - 2.f * margin) * (0.5f + 0.35f * std::sin((float)idx * 0.7f));
            series.push_back(x);
            series.push_back(y);
        }

        StyleDescriptor line;
        line = line.WithLine("steelblue", 2.f);
        line.lineJoin = LineJoin::Round;
        renderer.DrawPolyline(chart, series, line);

        auto marker = StyleDescriptor{}.WithFill("white").WithLine("steelblue", 1.5f);
        for (auto idx = 0; idx < (int)series.size(); idx += 2)
            renderer.DrawCircle(chart, ImVec2{ series[idx], series[idx + 1] }, 4.f, marker);
    }

    static void AnimateOverlay(ViewerState& state, double timestamp)
    {
        if (state.startTime < 0.0) state.startTime = timestamp;

        auto& renderer = *state.renderer;
        renderer.Clear(*state.overlay);

        auto size = state.container->size;
        auto phase = (float)((timestamp - state.startTime) / 1000.0);
        ImVec2 center{ size.x * 0.5f + size.x * 0.3f * std::cos(phase), size.y * 0.5f + size.y * 0.25f * std::sin(phase * 2.f) };

        auto& ctx = renderer.GetContext(*state.overlay);
        renderer.DrawEllipse(ctx, center, 18.f, 12.f, StyleDescriptor{}.WithFill("tomato", 0.8f).WithLine("darkred", 2.f));

        state.context->Scheduler().RequestFrame([&state](double ts) { AnimateOverlay(state, ts); });
    }

    static bool RunFrame(ImVec2 viewport, IPlatform& platform, void* data)
    {
        auto& state = *static_cast<ViewerState*>(data);
        state.context->Scheduler().DispatchFrame(platform.Now());

        auto bitmap = state.container->Composite();
        if (bitmap.empty()) return true;

        auto bytes = bitmap.ToRGBABytes();
        auto texture = platform.UploadTexture(ImVec2{ (float)bitmap.width, (float)bitmap.height }, bytes.data());

        ImGui::SetNextWindowPos(ImVec2{});
        ImGui::SetNextWindowSize(viewport);
        ImGui::Begin("vellum", nullptr, ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoBackground |
            ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoSavedSettings);
        ImGui::SetCursorPos(state.container->position);
        ImGui::Image(texture, ImVec2{ (float)bitmap.width, (float)bitmap.height });
        ImGui::End();

        return !ImGui::IsKeyPressed(ImGuiKey_Escape);
    }
}

int main(int argc, char** argv)
{
    using namespace vellum;

    auto platform = GetPlatform();
    if (!platform->CreateWindow({ .size = ImVec2{ 720.f, 560.f }, .title = "Vellum Viewer" }))
        return 1;

    RenderConfig config;
    config.platform = platform;
    RenderContext context{ config };

    try
    {
        HIGHLIGHT("Selected backend: %.*s\n", (int)ToString(context.SelectedBackend()).size(),
            ToString(context.SelectedBackend()).data());

        auto& renderer = context.Renderer();
        Container container{ context, ImVec2{ 640.f, 480.f }, ImVec2{ 40.f, 40.f } };
        container.AttachTo(*platform);

        auto chart = container.AddSurface();
        auto overlay = container.AddSurface();
        if (chart == nullptr || overlay == nullptr)
        {
            ERROR("Failed to create chart surfaces\n");
            return 1;
        }

        DrawChart(renderer, *chart, container.size);
        container.SetOpacity(overlay, 0.9f);

        container.On("mousedown", [&container, overlay](const HostEvent& event) {
            if (event.button != MouseButton::LeftMouseButton) return;
            if (container.IsVisible(overlay)) container.Hide(overlay);
            else container.Show(overlay);
        });

        ViewerState state;
        state.container = &container;
        state.renderer = &renderer;
        state.overlay = overlay;
        state.context = &context;
        context.Scheduler().RequestFrame([&state](double ts) { AnimateOverlay(state, ts); });

        platform->PollEvents(&RunFrame, &state);
    }
    catch (const std::exception& ex)
    {
        ERROR("Viewer failed: %s\n", ex.what());
        return 1;
    }

    return 0;
}
