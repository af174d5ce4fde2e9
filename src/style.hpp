#pragma once
#include <imgui.h>

// Call once after ImGui::CreateContext() and before the first frame.
// Dense rows and square corners: the client is a keyboard driven list viewer.
inline void SetupLookoutStyle()
{
    ImGui::StyleColorsDark();
    ImGuiStyle& s = ImGui::GetStyle();
    s.WindowRounding = 0.0f;
    s.FrameRounding = 3.0f;
    s.ChildRounding = 4.0f;
    s.PopupRounding = 6.0f;
    s.ScrollbarRounding = 4.0f;
    s.ScrollbarSize = 10.0f;

    s.FramePadding = ImVec2(6, 3);
    s.ItemSpacing = ImVec2(8, 3);
    s.CellPadding = ImVec2(6, 1);
    s.WindowPadding = ImVec2(10, 8);

    s.WindowBorderSize = 0.0f;
    s.PopupBorderSize = 1.0f;

    ImVec4* c = s.Colors;
    c[ImGuiCol_Text]            = ImVec4(0.88f, 0.92f, 0.96f, 1.00f);
    c[ImGuiCol_TextDisabled]    = ImVec4(0.50f, 0.56f, 0.62f, 1.00f);
    c[ImGuiCol_WindowBg]        = ImVec4(0.06f, 0.08f, 0.10f, 1.00f);
    c[ImGuiCol_ChildBg]         = ImVec4(0.07f, 0.09f, 0.12f, 1.00f);
    c[ImGuiCol_PopupBg]         = ImVec4(0.10f, 0.13f, 0.16f, 0.98f);
    c[ImGuiCol_ModalWindowDimBg] = ImVec4(0.00f, 0.00f, 0.00f, 0.55f);
    c[ImGuiCol_Border]          = ImVec4(0.20f, 0.26f, 0.30f, 0.80f);
    c[ImGuiCol_FrameBg]         = ImVec4(0.12f, 0.16f, 0.19f, 0.80f);
    c[ImGuiCol_Header]          = ImVec4(0.16f, 0.30f, 0.40f, 1.00f);
    c[ImGuiCol_HeaderHovered]   = ImVec4(0.18f, 0.26f, 0.32f, 1.00f);
    c[ImGuiCol_HeaderActive]    = ImVec4(0.20f, 0.34f, 0.44f, 1.00f);
    c[ImGuiCol_TableHeaderBg]   = ImVec4(0.10f, 0.13f, 0.16f, 1.00f);
    c[ImGuiCol_TableRowBgAlt]   = ImVec4(1.00f, 1.00f, 1.00f, 0.02f);
    c[ImGuiCol_Separator]       = ImVec4(0.23f, 0.30f, 0.35f, 0.60f);
    c[ImGuiCol_ScrollbarBg]     = ImVec4(0.06f, 0.08f, 0.10f, 0.70f);
    c[ImGuiCol_ScrollbarGrab]   = ImVec4(0.22f, 0.28f, 0.33f, 0.80f);
    c[ImGuiCol_PlotLines]       = ImVec4(0.27f, 0.80f, 1.00f, 1.00f);
}
