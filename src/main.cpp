#include <GLFW/glfw3.h>

#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

#include "AppConfig.hpp"
#include "EventQueue.hpp"
#include "FetchPipeline.hpp"
#include "JsonStore.hpp"
#include "Logging.hpp"
#include "Orchestrator.hpp"
#include "RequestTracker.hpp"
#include "ViewerApp.hpp"
#include "WorkerPool.hpp"
#include "style.hpp"

#include <spdlog/spdlog.h>

#include <spawn.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <string>
#include <vector>

extern char** environ;

namespace
{
    // Hands `url` to the desktop opener without waiting for it.
    bool openWithDesktop(const std::string& url)
    {
        pid_t pid = 0;
        std::string target = url;
        char* args[] = { const_cast<char*>("xdg-open"), target.data(), nullptr };
        const int rc = posix_spawnp(&pid, "xdg-open", nullptr, nullptr, args, environ);
        if (rc != 0)
        {
            spdlog::warn("xdg-open failed: {}", rc);
            return false;
        }
        spdlog::debug("opened {}", url);
        return true;
    }

    std::vector<JsonStore::DatasetSource> datasets(const DataConfig& data)
    {
        std::vector<JsonStore::DatasetSource> out;
        if (!data.logs.empty())    out.push_back({ "logs-default", data.logs });
        if (!data.traces.empty())  out.push_back({ "traces-default", data.traces });
        if (!data.metrics.empty()) out.push_back({ "metrics-default", data.metrics });
        return out;
    }
}

int main(int argc, char** argv)
{
    AppConfig cfg;
    std::string err;
    if (!AppConfig::resolve(argc, argv, cfg, &err))
    {
        std::fprintf(stderr, "lookout: %s\n\n%s", err.c_str(), AppConfig::usage());
        return 2;
    }
    if (cfg.showHelp)
    {
        std::fputs(AppConfig::usage(), stdout);
        return 0;
    }
    if (!initLogging(cfg.log, &err))
    {
        std::fprintf(stderr, "lookout: %s\n", err.c_str());
        return 1;
    }

    // spawned openers are never waited for
    std::signal(SIGCHLD, SIG_IGN);

    if (!glfwInit())
    {
        spdlog::error("Failed to initialize GLFW");
        return 1;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    GLFWwindow* window = glfwCreateWindow(1400, 860, "lookout", nullptr, nullptr);
    if (!window)
    {
        spdlog::error("Failed to create GLFW window");
        glfwTerminate();
        return 1;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;
    SetupLookoutStyle();

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 130");

    // ---- core ----
    JsonStore store(datasets(cfg.data), cfg.data.autoReload);
    RequestTracker tracker;
    EventQueue queue;
    if (!store.load(&err))
        queue.push(ErrorEvent{ err });

    WorkerPool pool(size_t(cfg.tui.workers));
    FetchPipeline pipeline(store, tracker, pool, queue, cfg.timeouts());

    Integrations integrations;
    integrations.copyText = [](const std::string& text) {
        ImGui::SetClipboardText(text.c_str());
        return true;
    };
    integrations.openUrl = openWithDesktop;

    Orchestrator* corePtr = nullptr;
    OrchestratorSettings settings;
    settings.tickInterval = std::chrono::milliseconds(cfg.tui.tickIntervalMs);
    settings.statusDuration = std::chrono::milliseconds(cfg.tui.statusDurationMs);
    settings.webUrl = cfg.ui.webUrl;
    settings.webUser = cfg.ui.webUser;
    settings.webPassword = cfg.ui.webPassword;
    settings.configPath = cfg.path;
    settings.reloadConfig = [&](std::string* outMessage) {
        // same layering as at startup so flags keep winning
        AppConfig next;
        if (!next.loadFile(cfg.path, outMessage)
            || !next.applyEnvironment(outMessage)
            || !next.applyArgs(argc, argv, outMessage)
            || !next.validate(outMessage))
            return false;
        pipeline.setTimeouts(next.timeouts());
        if (corePtr)
            corePtr->setTickInterval(std::chrono::milliseconds(next.tui.tickIntervalMs));
        cfg.tui = next.tui;
        return true;
    };

    Orchestrator core(pipeline, tracker, integrations, settings);
    corePtr = &core;

    ViewerApp viewer(core, store.endpoint(), [&queue](Event ev) { queue.push(std::move(ev)); });
    core.start(cfg.ui.signal, Lookback::OneDay);
    spdlog::info("started on {} with {} workers", store.endpoint(), pool.size());

    while (!glfwWindowShouldClose(window) && !core.quitRequested())
    {
        glfwPollEvents();

        const auto now = std::chrono::steady_clock::now();
        if (now >= core.nextTick())
            core.handle(TickEvent{ now });
        while (auto ev = queue.pop())
            core.handle(*ev);

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        viewer.pollInput();
        viewer.drawUI();

        ImGui::Render();
        int display_w, display_h;
        glfwGetFramebufferSize(window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.06f, 0.08f, 0.10f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        glfwSwapBuffers(window);
    }

    // workers hold references to the store, the queue and the tracker
    tracker.cancelAll();
    pool.shutdown();
    spdlog::info("shutting down");

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
    shutdownLogging();
    return 0;
}
