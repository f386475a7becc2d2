#pragma once

#include "types.h"

#include <functional>
#include <string_view>
#include <vector>

namespace vellum
{
    enum class MouseButton
    {
        LeftMouseButton = ImGuiMouseButton_Left,
        RightMouseButton = ImGuiMouseButton_Right,
        MiddleMouseButton = ImGuiMouseButton_Middle,
        Total
    };

    // Event forwarded from the host window to the surface adapter
    struct HostEvent
    {
        std::string_view type; // "mousedown", "mousemove", "wheel", "resize", ...
        ImVec2 pos;
        MouseButton button = MouseButton::Total;
        float wheelDelta = 0.f;
        void* data = nullptr;
    };

    struct WindowParams
    {
        ImVec2 size;
        std::string_view title;
        uint8_t bgcolor[4] = { 255, 255, 255, 255 };
    };

    using HostEventHandlerT = bool (*)(void* data, const HostEvent& event);

    struct IPlatform
    {
        virtual ~IPlatform() = default;

        virtual bool CreateWindow(const WindowParams& params) = 0;
        virtual bool PollEvents(bool (*runner)(ImVec2, IPlatform&, void*), void* data) = 0;
        virtual void PushEventHandler(HostEventHandlerT callback, void* data) = 0;
        virtual void RemoveEventHandler(void* data) = 0;

        virtual ImVec2 ViewportSize() const = 0;
        virtual ImVec2 ScrollOffset() const { return ImVec2{}; }

        // True when the platform calls FrameScheduler::DispatchFrame once per display refresh
        virtual bool DrivesFrames() const { return false; }

        // Monotonic time in milliseconds
        virtual double Now() const;

        // RGBA8 pixels, returns a texture usable with ImGui::Image
        virtual ImTextureID UploadTexture(ImVec2 size, const unsigned char* pixels) { return ImTextureID{}; }

        int64_t frameCount = 0;
    };

    // Provided by the platform integration that is linked in (viewer/platform.cpp for GLFW)
    IPlatform* GetPlatform();

    using FrameCallbackT = std::function<void(double)>;

    // Once-per-refresh callback queue. With a platform that drives frames, pending callbacks
    // run on the next DispatchFrame(). Otherwise a timer fallback assigns each request a due
    // time of max(0, interval - (now - lastTime)) ms and Poll() runs whatever is due.
    // Callbacks requested while a batch runs wait for the next batch.
    struct FrameScheduler
    {
        explicit FrameScheduler(IPlatform* platform = nullptr, int32_t intervalMs = VELLUM_FRAME_INTERVAL_MS);

        int32_t RequestFrame(FrameCallbackT callback);
        bool CancelFrame(int32_t id);

        int DispatchFrame(double timestamp);
        int Poll(double now);
        int Poll();

        [[nodiscard]] int Pending() const;
        [[nodiscard]] bool UsesTimerFallback() const;
        [[nodiscard]] double Now() const;

        struct Entry
        {
            int32_t id = 0;
            FrameCallbackT callback;
            double due = 0.0;
        };

        IPlatform* platform = nullptr;
        int32_t interval = VELLUM_FRAME_INTERVAL_MS;
        int32_t nextId = 1;
        double lastTime = 0.0;
        std::vector<Entry> pending;
        std::vector<Entry>* running = nullptr;

    private:
        int Run(std::vector<Entry>& batch, std::optional<double> timestamp);
    };
}
