#include "widgets.hpp"

// import archi
#include "archi/string_utils.hpp"  // for make_multiline

#include <algorithm>  // for transform
#include <iterator>   // for back_insert_iterator
#include <memory>     // for shared_ptr
#include <string>     // for string
#include <utility>    // for move

#include <ftxui/component/captured_mouse.hpp>      // for ftxui
#include <ftxui/component/component.hpp>           // for Renderer, Vertical
#include <ftxui/component/component_base.hpp>      // for ComponentBase, Com...
#include <ftxui/component/component_options.hpp>   // for ButtonOption, Inpu...
#include <ftxui/component/screen_interactive.hpp>  // for ScreenInteractive
#include <ftxui/dom/elements.hpp>                  // for operator|, Element
#include <ftxui/util/ref.hpp>                      // for Ref

using namespace ftxui;

namespace tui::detail {

namespace {

auto controls_row(Component& controls_container) noexcept -> Component {
    return Renderer(controls_container, [controls_container] {
        return controls_container->Render() | hcenter | size(HEIGHT, LESS_THAN, 3) | size(WIDTH, GREATER_THAN, 25);
    });
}

}  // namespace

Element centered_widget(Component& container, std::string_view title, const Element& widget) noexcept {
    return vbox({
        //  -------- Title --------------
        text(std::string{title}) | bold,
        filler(),
        //  -------- Center Menu --------------
        hbox({
            filler(),
            border(vbox({
                widget,
                separator(),
                container->Render() | hcenter | size(HEIGHT, LESS_THAN, 3) | size(WIDTH, GREATER_THAN, 25),
            })),
            filler(),
        }) | center,
        filler(),
    });
}

Component controls_widget(const std::array<std::string_view, 2>&& titles, const std::array<std::function<void()>, 2>&& callbacks) noexcept {
    /* clang-format off */
    auto button_ok       = Button(std::string{titles[0]}, callbacks[0], ButtonOption::WithoutBorder());
    auto button_quit     = Button(std::string{titles[1]}, callbacks[1], ButtonOption::WithoutBorder());
    /* clang-format on */

    return Container::Horizontal({
        button_ok,
        Renderer([] { return filler() | size(WIDTH, GREATER_THAN, 3); }),
        button_quit,
    });
}

Element centered_interative_multi(std::string_view title, Component& widgets) noexcept {
    return vbox({
        //  -------- Title --------------
        text(std::string{title}) | bold,
        filler(),
        //  -------- Center Menu --------------
        hbox({
            filler(),
            border(vbox({
                widgets->Render(),
            })),
            filler(),
        }) | center,
        filler(),
    });
}

Element multiline_text(const std::vector<std::string>& lines) noexcept {
    Elements multiline;

    std::transform(lines.cbegin(), lines.cend(), std::back_inserter(multiline),
        [](const std::string& line) -> Element { return text(line); });
    return vbox(std::move(multiline)) | frame;
}

void msgbox_widget(std::string_view content, Decorator boxsize) noexcept {
    auto screen = ScreenInteractive::Fullscreen();
    /* clang-format off */
    auto button_back = Button("OK", screen.ExitLoopClosure(), ButtonOption::WithoutBorder());

    auto container = Container::Horizontal({button_back});
    auto renderer = Renderer(container, [&] {
        return centered_widget(container, WIDGET_TITLE, multiline_text(archi::utils::make_multiline(content)) | boxsize);
    });
    /* clang-format on */

    screen.Loop(renderer);
}

bool inputbox_widget(std::string& value, std::string_view content, Decorator boxsize, bool password) noexcept {
    auto screen = ScreenInteractive::Fullscreen();
    bool success{};
    auto ok_callback = [&] {
        success = true;
        screen.ExitLoopClosure()();
    };
    InputOption input_option{.on_enter = ok_callback, .password = password};
    auto input_value       = Input(&value, "", input_option);
    auto content_container = Renderer([&] {
        return multiline_text(archi::utils::make_multiline(content)) | hcenter | boxsize;
    });

    auto controls_container = controls_widget({"OK", "Cancel"}, {ok_callback, screen.ExitLoopClosure()});
    auto controls           = controls_row(controls_container);

    auto global = Container::Vertical({
        content_container,
        Renderer([] { return separator(); }),
        input_value,
        Renderer([] { return separator(); }),
        controls,
    });

    auto renderer = Renderer(global, [&] {
        return centered_interative_multi(WIDGET_TITLE, global);
    });

    screen.Loop(renderer);
    return success;
}

bool yesno_widget(std::string_view content, Decorator boxsize) noexcept {
    auto screen = ScreenInteractive::Fullscreen();

    bool success{};
    auto ok_callback = [&] {
        success = true;
        screen.ExitLoopClosure()();
    };
    auto controls_container = controls_widget({"Yes", "No"}, {ok_callback, screen.ExitLoopClosure()});
    auto controls           = controls_row(controls_container);

    auto container = Container::Horizontal({
        controls,
    });

    auto renderer = Renderer(container, [&] {
        return centered_widget(container, WIDGET_TITLE, multiline_text(archi::utils::make_multiline(content)) | hcenter | boxsize);
    });

    screen.Loop(renderer);
    return success;
}

void menu_widget(const std::vector<std::string>& entries, const std::function<void()>&& ok_callback, std::int32_t* selected, ScreenInteractive* screen, std::string_view text, const WidgetBoxSize widget_sizes) noexcept {
    MenuOption menu_option{.on_enter = ok_callback};
    auto menu    = Menu(&entries, selected, menu_option);
    auto content = Renderer(menu, [&] {
        return menu->Render() | center | widget_sizes.content_size;
    });

    auto controls_container = controls_widget({"OK", "Cancel"}, {ok_callback, screen->ExitLoopClosure()});
    auto controls           = controls_row(controls_container);

    Components children{};
    if (!text.empty()) {
        children = {
            Renderer([&] { return detail::multiline_text(archi::utils::make_multiline(text)) | widget_sizes.text_size; }),
            Renderer([] { return separator(); }),
            content,
            Renderer([] { return separator(); }),
            controls};
    } else {
        children = {
            content,
            Renderer([] { return separator(); }),
            controls};
    }
    auto global{Container::Vertical(children)};

    auto renderer = Renderer(global, [&] {
        return centered_interative_multi(WIDGET_TITLE, global);
    });

    screen->Loop(renderer);
}

}  // namespace tui::detail
