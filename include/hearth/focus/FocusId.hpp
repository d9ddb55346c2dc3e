#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace hearth::focus
{

using FocusId = std::string;

inline constexpr std::string_view kButtonPrefix = "BTN@";
inline constexpr std::string_view kGamePrefix = "GAME@";

enum class ButtonKind
{
    Games,
    RecentlyPlayed,
    Settings,
};

struct ButtonActivation
{
    ButtonKind kind;

    bool operator==(const ButtonActivation&) const = default;
};

struct GameLaunch
{
    std::string uuid;

    bool operator==(const GameLaunch&) const = default;
};

//! What the host receives when an element is activated.
using Activation = std::variant<ButtonActivation, GameLaunch>;

//! Builds an Activation visitor from one lambda per alternative.
template <class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

[[nodiscard]] std::string_view ToString(ButtonKind kind) noexcept;
[[nodiscard]] std::optional<ButtonKind> ButtonKindFromString(std::string_view name) noexcept;

[[nodiscard]] FocusId MakeButtonId(ButtonKind kind);
[[nodiscard]] FocusId MakeGameId(std::string_view uuid);

[[nodiscard]] bool IsButtonId(std::string_view id) noexcept;
[[nodiscard]] bool IsGameId(std::string_view id) noexcept;

//! Maps a focus id back to a typed activation. Unknown prefixes, unknown
//! button names and empty game uuids yield std::nullopt.
[[nodiscard]] std::optional<Activation> ParseActivation(std::string_view id);

[[nodiscard]] FocusId ToFocusId(const Activation& activation);

} // namespace hearth::focus
