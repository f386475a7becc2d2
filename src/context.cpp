#include "context.h"
#include "style.h"

#include <lunasvg.h>
#include <plutovg.h>

namespace vellum
{
#pragma region Host environment

    // Smallest document exercising the SVG 1.0 basic shapes
    static constexpr std::string_view ShapeProbeDocument =
        "<svg xmlns='http://www.w3.org/2000/svg' version='1.0' width='4' height='4'>"
        "<rect x='0' y='0' width='2' height='2' fill='#000'/>"
        "<circle cx='3' cy='3' r='1' fill='#000'/>"
        "</svg>";

    struct HostEnvironment final : public IEnvironment
    {
        bool HasFeature(std::string_view feature, std::string_view version) override
        {
            if (feature != VELLUM_SVG_FEATURE_SHAPE)
            {
                LOG("Unknown feature queried: %.*s\n", (int)feature.size(), feature.data());
                return false;
            }

            if (!version.empty() && version != "1.0" && version != "1.1")
                return false;

            auto document = lunasvg::Document::loadFromData(std::string{ ShapeProbeDocument });
            if (!document) return false;

            auto bitmap = document->renderToBitmap(4, 4);
            return !bitmap.isNull();
        }

        bool CanCreateContext(std::string_view type) override
        {
            if (!AreSame(type, VELLUM_RASTER_CONTEXT_TYPE)) return false;

            auto surface = plutovg_surface_create(1, 1);
            if (surface == nullptr) return false;

            auto canvas = plutovg_canvas_create(surface);
            auto result = canvas != nullptr;

            if (canvas != nullptr) plutovg_canvas_destroy(canvas);
            plutovg_surface_destroy(surface);
            return result;
        }
    };

    IEnvironment& GetHostEnvironment()
    {
        static HostEnvironment environment;
        return environment;
    }

#pragma endregion

#pragma region RenderContext

    RenderContext::RenderContext(const RenderConfig& cfg)
        : config{ cfg }, scheduler{ cfg.platform, cfg.frameIntervalMs }
    {}

    void RenderContext::Resolve()
    {
        auto svg = CreateSVGRenderer(config);
        if (svg->IsSupported())
        {
            selected = BackendType::SVG;
            renderer = std::move(svg);
        }
        else
        {
            auto raster = CreateRasterRenderer(config);
            if (raster->IsSupported())
            {
                selected = BackendType::Raster;
                renderer = std::move(raster);
            }
            else
            {
                selected = BackendType::None;
                renderer = CreateNullRenderer();
                ERROR("No supported rendering backend, draw calls will fail\n");
            }
        }

        state = ProbeState::Resolved;
        HIGHLIGHT("Selected rendering backend: %.*s\n", (int)ToString(selected).size(), ToString(selected).data());
    }

    BackendType RenderContext::SelectedBackend()
    {
        if (state == ProbeState::Untested) Resolve();
        return selected;
    }

    IRenderer& RenderContext::Renderer()
    {
        if (state == ProbeState::Untested) Resolve();
        return *renderer;
    }

#pragma endregion

    std::string_view ToString(BackendType type)
    {
        switch (type)
        {
        case BackendType::SVG: return "svg";
        case BackendType::Raster: return "raster";
        default: return "none";
        }
    }
}
