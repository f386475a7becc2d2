#pragma once

#include "context.h"

#include <functional>
#include <map>

namespace vellum
{
    // Host view of one chart: owns its drawing surfaces, stacked at the container
    // origin in creation order, and routes host events to registered listeners.
    struct Container
    {
        using ListenerT = std::function<void(const HostEvent&)>;
        using StyleList = std::vector<std::pair<std::string, std::string>>;

        struct Layer
        {
            std::unique_ptr<ISurface> surface;
            IRenderer* renderer = nullptr;
            StyleList style;
            float opacity = 1.f;
            bool visible = true;
        };

        struct Listener
        {
            int32_t id = 0;
            ListenerT callback;
        };

        Container(RenderContext& context, ImVec2 size, ImVec2 pos = ImVec2{});
        ~Container();

        Container(const Container&) = delete;
        Container& operator=(const Container&) = delete;

        // Creates a surface through the selected renderer and stacks it above the existing ones.
        // Returns nullptr if the renderer could not create one.
        ISurface* AddSurface();
        ISurface* AddSurface(IRenderer& renderer);
        bool RemoveSurface(const ISurface* surface);
        [[nodiscard]] int SurfaceCount() const { return (int)layers.size(); }
        [[nodiscard]] ISurface* SurfaceAt(int index) const;

        void Show(const ISurface* surface);
        void Hide(const ISurface* surface);
        [[nodiscard]] bool IsVisible(const ISurface* surface) const;
        void SetOpacity(const ISurface* surface, float alpha);
        void SetLayerStyle(const ISurface* surface, std::string_view property, std::string_view value);
        [[nodiscard]] std::optional<std::string_view> LayerStyle(const ISurface* surface, std::string_view property) const;

        // Flattens visible layers bottom-up with source-over blending and layer opacity
        [[nodiscard]] Bitmap Composite() const;

        // types is a space separated list, e.g. "mousedown mouseup"
        int32_t On(std::string_view types, ListenerT listener);
        bool Off(std::string_view types, int32_t id);
        int Dispatch(std::string_view type, const HostEvent& event);

        // Routes host events of the platform to Dispatch() until the container is destroyed
        void AttachTo(IPlatform& platform);

        // Rectangle relative to the viewport, i.e. page position minus scroll offset
        [[nodiscard]] ImRect Bounds() const;

        // Amount by which each edge of rect (viewport coordinates) falls outside the viewport
        [[nodiscard]] FourSidedMeasure IsRectInViewport(const ImRect& rect, float margin = 0.f) const;

        [[nodiscard]] ImVec2 ViewportSize() const;
        [[nodiscard]] ImVec2 PageOffset() const;

        RenderContext& context;
        ImVec2 size;
        ImVec2 position;
        std::vector<Layer> layers;
        std::map<std::string, std::vector<Listener>, std::less<>> listeners;
        int32_t nextListenerId = 1;
        IPlatform* attached = nullptr;

    private:
        Layer* FindLayer(const ISurface* surface);
        const Layer* FindLayer(const ISurface* surface) const;
    };
}
