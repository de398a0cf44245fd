#ifndef WIDGETS_HPP
#define WIDGETS_HPP

#include <array>        // for array
#include <cstdint>      // for int32_t
#include <functional>   // for function
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <ftxui/component/component_base.hpp>      // for Components
#include <ftxui/component/screen_interactive.hpp>  // for Component
#include <ftxui/dom/elements.hpp>                  // for size, GREATER_THAN

namespace tui::detail {

inline constexpr std::string_view WIDGET_TITLE{"Arch Guided Installer"};

struct WidgetBoxSize {
    ftxui::Decorator content_size = size(ftxui::HEIGHT, ftxui::GREATER_THAN, 10) | size(ftxui::WIDTH, ftxui::GREATER_THAN, 40);
    ftxui::Decorator text_size    = size(ftxui::HEIGHT, ftxui::GREATER_THAN, 5);
};

auto centered_widget(ftxui::Component& container, std::string_view title, const ftxui::Element& widget) noexcept -> ftxui::Element;
auto controls_widget(const std::array<std::string_view, 2>&& titles, const std::array<std::function<void()>, 2>&& callbacks) noexcept -> ftxui::Component;
auto centered_interative_multi(std::string_view title, ftxui::Component& widgets) noexcept -> ftxui::Element;
auto multiline_text(const std::vector<std::string>& lines) noexcept -> ftxui::Element;
void msgbox_widget(std::string_view content, ftxui::Decorator boxsize = ftxui::hcenter | size(ftxui::HEIGHT, ftxui::GREATER_THAN, 5)) noexcept;
bool inputbox_widget(std::string& value, std::string_view content, ftxui::Decorator boxsize = size(ftxui::HEIGHT, ftxui::GREATER_THAN, 5), bool password = false) noexcept;
bool yesno_widget(std::string_view content, ftxui::Decorator boxsize = size(ftxui::HEIGHT, ftxui::GREATER_THAN, 5)) noexcept;
void menu_widget(const std::vector<std::string>& entries, const std::function<void()>&& ok_callback, std::int32_t* selected, ftxui::ScreenInteractive* screen, std::string_view text = "", const WidgetBoxSize widget_sizes = {}) noexcept;

}  // namespace tui::detail

#endif  // WIDGETS_HPP
