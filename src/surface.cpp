#include "surface.h"

#include <algorithm>

namespace vellum
{
    static bool HandleHostEvent(void* data, const HostEvent& event)
    {
        auto container = (Container*)data;
        container->Dispatch(event.type, event);
        return true;
    }

    // Source-over on premultiplied ARGB32, src scaled by the layer opacity
    static uint32_t BlendPremultiplied(uint32_t dst, uint32_t src, float opacity)
    {
        auto sa = (float)(src >> 24) * opacity;
        if (sa <= 0.f) return dst;

        auto inv = 1.f - sa / 255.f;
        uint32_t result = 0;

        for (auto shift = 0; shift <= 24; shift += 8)
        {
            auto s = (float)((src >> shift) & 0xff) * opacity;
            auto d = (float)((dst >> shift) & 0xff);
            auto c = (uint32_t)clamp((int)std::lround(s + d * inv), 0, 255);
            result |= c << shift;
        }

        return result;
    }

    Container::Container(RenderContext& ctx, ImVec2 sz, ImVec2 pos)
        : context{ ctx }, size{ sz }, position{ pos }
    {}

    Container::~Container()
    {
        if (attached != nullptr) attached->RemoveEventHandler(this);
    }

    Container::Layer* Container::FindLayer(const ISurface* surface)
    {
        auto it = std::find_if(layers.begin(), layers.end(), [surface](const Layer& layer) { return layer.surface.get() == surface; });
        return it != layers.end() ? &(*it) : nullptr;
    }

    const Container::Layer* Container::FindLayer(const ISurface* surface) const
    {
        auto it = std::find_if(layers.begin(), layers.end(), [surface](const Layer& layer) { return layer.surface.get() == surface; });
        return it != layers.end() ? &(*it) : nullptr;
    }

    ISurface* Container::AddSurface()
    {
        return AddSurface(context.Renderer());
    }

    ISurface* Container::AddSurface(IRenderer& renderer)
    {
        auto surface = renderer.GetCanvas(size);
        if (!surface)
        {
            ERROR("Renderer could not create a %.0fx%.0f surface\n", size.x, size.y);
            return nullptr;
        }

        auto& layer = layers.emplace_back();
        layer.surface = std::move(surface);
        layer.renderer = &renderer;
        layer.style = { { "position", "absolute" }, { "left", "0" }, { "top", "0" } };
        return layer.surface.get();
    }

    bool Container::RemoveSurface(const ISurface* surface)
    {
        auto it = std::find_if(layers.begin(), layers.end(), [surface](const Layer& layer) { return layer.surface.get() == surface; });
        if (it == layers.end()) return false;

        layers.erase(it);
        return true;
    }

    ISurface* Container::SurfaceAt(int index) const
    {
        return index >= 0 && index < (int)layers.size() ? layers[index].surface.get() : nullptr;
    }

    void Container::Show(const ISurface* surface)
    {
        if (auto layer = FindLayer(surface); layer != nullptr)
        {
            layer->visible = true;
            SetLayerStyle(surface, "visibility", "visible");
        }
    }

    void Container::Hide(const ISurface* surface)
    {
        if (auto layer = FindLayer(surface); layer != nullptr)
        {
            layer->visible = false;
            SetLayerStyle(surface, "visibility", "hidden");
        }
    }

    bool Container::IsVisible(const ISurface* surface) const
    {
        auto layer = FindLayer(surface);
        return layer != nullptr && layer->visible;
    }

    void Container::SetOpacity(const ISurface* surface, float alpha)
    {
        if (auto layer = FindLayer(surface); layer != nullptr)
        {
            layer->opacity = clamp(alpha, 0.f, 1.f);
            SetLayerStyle(surface, "opacity", ToString(layer->opacity));
        }
    }

    void Container::SetLayerStyle(const ISurface* surface, std::string_view property, std::string_view value)
    {
        auto layer = FindLayer(surface);
        if (layer == nullptr) return;

        auto it = std::find_if(layer->style.begin(), layer->style.end(), [property](const auto& entry) { return entry.first == property; });
        if (it != layer->style.end()) it->second = std::string{ value };
        else layer->style.emplace_back(std::string{ property }, std::string{ value });

        // Vector surfaces carry the layer style on their root element as well
        if (auto svg = dynamic_cast<const SVGSurface*>(surface); svg != nullptr)
            svg->Root()->SetStyle(property, value);
    }

    std::optional<std::string_view> Container::LayerStyle(const ISurface* surface, std::string_view property) const
    {
        auto layer = FindLayer(surface);
        if (layer == nullptr) return std::nullopt;

        for (const auto& [key, value] : layer->style)
            if (key == property) return std::string_view{ value };
        return std::nullopt;
    }

    Bitmap Container::Composite() const
    {
        Bitmap result{ (int32_t)std::ceil(size.x), (int32_t)std::ceil(size.y) };
        if (result.empty()) return result;

        for (const auto& layer : layers)
        {
            if (!layer.visible || layer.opacity <= 0.f) continue;

            auto source = layer.surface->Rasterize();
            auto rows = std::min(result.height, source.height);
            auto cols = std::min(result.width, source.width);

            for (auto y = 0; y < rows; ++y)
                for (auto x = 0; x < cols; ++x)
                {
                    auto& dst = result.pixels[(size_t)y * result.width + x];
                    dst = BlendPremultiplied(dst, source.pixels[(size_t)y * source.width + x], layer.opacity);
                }
        }

        return result;
    }

    int32_t Container::On(std::string_view types, ListenerT listener)
    {
        auto id = nextListenerId++;

        for (auto type : SplitBySpace(types))
        {
            auto it = listeners.find(type);
            if (it == listeners.end()) it = listeners.emplace(std::string{ type }, std::vector<Listener>{}).first;
            it->second.push_back(Listener{ id, listener });
        }

        return id;
    }

    bool Container::Off(std::string_view types, int32_t id)
    {
        auto removed = false;

        for (auto type : SplitBySpace(types))
        {
            auto it = listeners.find(type);
            if (it == listeners.end()) continue;

            auto& entries = it->second;
            auto count = entries.size();
            entries.erase(std::remove_if(entries.begin(), entries.end(),
                [id](const Listener& entry) { return entry.id == id; }), entries.end());
            removed = removed || entries.size() != count;
        }

        return removed;
    }

    int Container::Dispatch(std::string_view type, const HostEvent& event)
    {
        auto it = listeners.find(type);
        if (it == listeners.end()) return 0;

        // Listeners may subscribe or unsubscribe while being notified
        auto entries = it->second;
        for (const auto& entry : entries)
            entry.callback(event);

        return (int)entries.size();
    }

    void Container::AttachTo(IPlatform& platform)
    {
        if (attached != nullptr) attached->RemoveEventHandler(this);

        attached = &platform;
        platform.PushEventHandler(&HandleHostEvent, this);
    }

    ImVec2 Container::ViewportSize() const
    {
        auto platform = context.Platform();
        return platform != nullptr ? platform->ViewportSize() : size;
    }

    ImVec2 Container::PageOffset() const
    {
        auto platform = context.Platform();
        return platform != nullptr ? platform->ScrollOffset() : ImVec2{};
    }

    ImRect Container::Bounds() const
    {
        auto min = position - PageOffset();
        return ImRect{ min, min + size };
    }

    FourSidedMeasure Container::IsRectInViewport(const ImRect& rect, float margin) const
    {
        auto viewport = ViewportSize();
        FourSidedMeasure overflow;
        overflow.top = rect.Min.y - margin < 0.f ? -(rect.Min.y - margin) : 0.f;
        overflow.right = rect.Max.x + margin > viewport.x ? rect.Max.x + margin - viewport.x : 0.f;
        overflow.bottom = rect.Max.y + margin > viewport.y ? rect.Max.y + margin - viewport.y : 0.f;
        overflow.left = rect.Min.x - margin < 0.f ? -(rect.Min.x - margin) : 0.f;
        return overflow;
    }
}
