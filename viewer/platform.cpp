#include "platform.h"

#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include "imgui_impl_opengl3_loader.h"

#define GL_SILENCE_DEPRECATION
#include <GLFW/glfw3.h>

namespace vellum
{
    static void ReportGlfwError(int code, const char* message)
    {
        std::fprintf(stderr, "GLFW error %d: %s\n", code, message);
    }

    // Requests a core context and returns the matching GLSL version string
    static const char* ApplyContextHints()
    {
#if defined(__APPLE__)
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 2);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
        glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
        return "#version 150";
#else
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);
        return "#version 130";
#endif
    }

    struct GLFWViewerPlatform final : public IPlatform
    {
        bool CreateWindow(const WindowParams& params) override
        {
            glfwSetErrorCallback(ReportGlfwError);
            if (glfwInit() == GLFW_FALSE)
            {
                ERROR("GLFW initialization failed\n");
                return false;
            }

            auto shaderVersion = ApplyContextHints();
            auto width = (int)params.size.x, height = (int)params.size.y;
            std::string title{ params.title };

            handle = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
            if (handle == nullptr)
            {
                ERROR("Failed to create a %dx%d window\n", width, height);
                glfwTerminate();
                return false;
            }

            glfwMakeContextCurrent(handle);
            glfwSwapInterval(1);

            IMGUI_CHECKVERSION();
            ImGui::CreateContext();
            ImGui::GetIO().IniFilename = nullptr;
            ImGui_ImplGlfw_InitForOpenGL(handle, true);
            ImGui_ImplOpenGL3_Init(shaderVersion);

            for (auto channel = 0; channel < 4; ++channel)
                clearColor[channel] = (float)params.bgcolor[channel] / 255.f;

            HIGHLIGHT("Viewer window %dx%d created (%s)\n", width, height, shaderVersion);
            return true;
        }

        // Translates this frame's ImGui mouse state into host events
        void EmitMouseEvents()
        {
            const auto& io = ImGui::GetIO();
            HostEvent event;
            event.pos = io.MousePos;

            for (auto button = 0; button < (int)MouseButton::Total; ++button)
            {
                event.button = (MouseButton)button;
                if (ImGui::IsMouseClicked(button)) Emit("mousedown", event);
                if (ImGui::IsMouseReleased(button)) Emit("mouseup", event);
            }

            event.button = MouseButton::Total;
            if (io.MouseDelta.x != 0.f || io.MouseDelta.y != 0.f) Emit("mousemove", event);

            if (io.MouseWheel != 0.f)
            {
                event.wheelDelta = io.MouseWheel;
                Emit("wheel", event);
            }
        }

        void Emit(std::string_view type, HostEvent event)
        {
            event.type = type;
            auto snapshot = handlers;
            for (const auto& [data, handler] : snapshot)
                handler(data, event);
        }

        void PresentFrame()
        {
            int fbWidth = 0, fbHeight = 0;
            glfwGetFramebufferSize(handle, &fbWidth, &fbHeight);
            glViewport(0, 0, fbWidth, fbHeight);
            glClearColor(clearColor[0], clearColor[1], clearColor[2], clearColor[3]);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
            glfwSwapBuffers(handle);
        }

        bool PollEvents(bool (*runner)(ImVec2, IPlatform&, void*), void* data) override
        {
            if (handle == nullptr) return false;

            auto keepRunning = true;
            while (keepRunning && glfwWindowShouldClose(handle) == GLFW_FALSE)
            {
                glfwPollEvents();
                if (glfwGetWindowAttrib(handle, GLFW_ICONIFIED) != 0)
                {
                    ImGui_ImplGlfw_Sleep(10);
                    continue;
                }

                ImGui_ImplOpenGL3_NewFrame();
                ImGui_ImplGlfw_NewFrame();
                ImGui::NewFrame();

                EmitMouseEvents();
                keepRunning = runner(ViewportSize(), *this, data);

                ImGui::Render();
                PresentFrame();
                DeleteFrameTextures();
                frameCount++;
            }

            Shutdown();
            return true;
        }

        void PushEventHandler(HostEventHandlerT callback, void* data) override
        {
            handlers.emplace_back(data, callback);
        }

        void RemoveEventHandler(void* data) override
        {
            handlers.erase(std::remove_if(handlers.begin(), handlers.end(),
                [data](const auto& entry) { return entry.first == data; }), handlers.end());
        }

        ImVec2 ViewportSize() const override
        {
            int width = 0, height = 0;
            if (handle != nullptr) glfwGetWindowSize(handle, &width, &height);
            return ImVec2{ (float)width, (float)height };
        }

        bool DrivesFrames() const override { return true; }

        double Now() const override { return glfwGetTime() * 1000.0; }

        // Textures are deleted once the frame they were uploaded in is presented
        ImTextureID UploadTexture(ImVec2 size, const unsigned char* pixels) override
        {
            GLint previous = 0;
            glGetIntegerv(GL_TEXTURE_BINDING_2D, &previous);

            GLuint texture = 0;
            glGenTextures(1, &texture);
            glBindTexture(GL_TEXTURE_2D, texture);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
            glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
            glPixelStorei(GL_UNPACK_ROW_LENGTH, 0);
            glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, (GLsizei)size.x, (GLsizei)size.y, 0,
                GL_RGBA, GL_UNSIGNED_BYTE, pixels);
            glBindTexture(GL_TEXTURE_2D, (GLuint)previous);

            frameTextures.push_back(texture);
            return (ImTextureID)(intptr_t)texture;
        }

        void DeleteFrameTextures()
        {
            if (!frameTextures.empty())
                glDeleteTextures((GLsizei)frameTextures.size(), frameTextures.data());
            frameTextures.clear();
        }

        void Shutdown()
        {
            DeleteFrameTextures();
            ImGui_ImplOpenGL3_Shutdown();
            ImGui_ImplGlfw_Shutdown();
            ImGui::DestroyContext();

            glfwDestroyWindow(handle);
            glfwTerminate();
            handle = nullptr;
        }

        GLFWwindow* handle = nullptr;
        float clearColor[4] = { 1.f, 1.f, 1.f, 1.f };
        std::vector<GLuint> frameTextures;
        std::vector<std::pair<void*, HostEventHandlerT>> handlers;
    };

    IPlatform* GetPlatform()
    {
        static GLFWViewerPlatform platform;
        return &platform;
    }
}
