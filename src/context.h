#pragma once

#include "types.h"
#include "renderer.h"
#include "platform.h"

namespace vellum
{
    // Capability queries the backend probe relies on
    struct IEnvironment
    {
        virtual ~IEnvironment() = default;

        // e.g. HasFeature("http://www.w3.org/TR/SVG11/feature#Shape", "1.0")
        virtual bool HasFeature(std::string_view feature, std::string_view version) = 0;

        // True if a drawing context of this type ("2d") can be created on a fresh buffer
        virtual bool CanCreateContext(std::string_view type) = 0;
    };

    // Answers through lunasvg (SVG features) and plutovg (2d contexts)
    IEnvironment& GetHostEnvironment();

    // Owns the backend selection for its lifetime. The first query probes the SVG backend,
    // then raster, and the first supported one wins. When neither is supported the selection
    // is BackendType::None and the renderer throws ConfigurationError on every call.
    struct RenderContext
    {
        enum class ProbeState { Untested, Resolved };

        explicit RenderContext(const RenderConfig& config = RenderConfig{});

        RenderContext(const RenderContext&) = delete;
        RenderContext& operator=(const RenderContext&) = delete;

        BackendType SelectedBackend();
        IRenderer& Renderer();
        FrameScheduler& Scheduler() { return scheduler; }
        [[nodiscard]] const RenderConfig& Config() const { return config; }
        [[nodiscard]] IPlatform* Platform() const { return config.platform; }
        [[nodiscard]] bool IsResolved() const { return state == ProbeState::Resolved; }

        RenderConfig config;
        ProbeState state = ProbeState::Untested;
        BackendType selected = BackendType::None;
        std::unique_ptr<IRenderer> renderer;
        FrameScheduler scheduler;

    private:
        void Resolve();
    };

    [[nodiscard]] std::string_view ToString(BackendType type);
}
