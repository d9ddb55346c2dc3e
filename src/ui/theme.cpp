#include "ui/theme.hpp"

#include "utils/color.hpp"

namespace hearth::ui
{

HomeTheme DefaultHomeTheme()
{
    HomeTheme theme;
    theme.background = color::ParseHexColor("#1e1e2e");
    theme.backgroundGradientEnd = color::ParseHexColor("#11111b");
    theme.titleBar = color::ParseHexColor("#181825cc");
    theme.buttonText = color::ParseHexColor("#cdd6f4");
    theme.buttonFocused = color::ParseHexColor("#89b4fa");
    theme.buttonPressed = color::ParseHexColor("#74c7ec");
    theme.tile = color::ParseHexColor("#313244");
    theme.tileHover = color::ParseHexColor("#45475a");
    theme.tileFocusedOutline = color::ParseHexColor("#f5c2e7");
    theme.tilePressed = color::ParseHexColor("#585b70");
    theme.tileTitle = color::ParseHexColor("#cdd6f4");
    theme.muted = color::ParseHexColor("#6c7086");
    return theme;
}

} // namespace hearth::ui
