#include "hearth/focus/FocusId.hpp"

#include <array>
#include <utility>

namespace hearth::focus
{
namespace
{
struct ButtonName
{
    ButtonKind kind;
    std::string_view name;
};

constexpr std::array<ButtonName, 3> kButtonNames{{
    {ButtonKind::Games, "GAMES"},
    {ButtonKind::RecentlyPlayed, "RECENTLY_PLAYED"},
    {ButtonKind::Settings, "SETTINGS"},
}};
} // namespace

std::string_view ToString(ButtonKind kind) noexcept
{
    for (const auto& entry : kButtonNames)
    {
        if (entry.kind == kind)
        {
            return entry.name;
        }
    }
    return {};
}

std::optional<ButtonKind> ButtonKindFromString(std::string_view name) noexcept
{
    for (const auto& entry : kButtonNames)
    {
        if (entry.name == name)
        {
            return entry.kind;
        }
    }
    return std::nullopt;
}

FocusId MakeButtonId(ButtonKind kind)
{
    FocusId id{kButtonPrefix};
    id.append(ToString(kind));
    return id;
}

FocusId MakeGameId(std::string_view uuid)
{
    FocusId id{kGamePrefix};
    id.append(uuid);
    return id;
}

bool IsButtonId(std::string_view id) noexcept
{
    return id.starts_with(kButtonPrefix);
}

bool IsGameId(std::string_view id) noexcept
{
    return id.starts_with(kGamePrefix);
}

std::optional<Activation> ParseActivation(std::string_view id)
{
    if (IsButtonId(id))
    {
        if (const auto kind = ButtonKindFromString(id.substr(kButtonPrefix.size())))
        {
            return Activation{ButtonActivation{*kind}};
        }
        return std::nullopt;
    }

    if (IsGameId(id))
    {
        const std::string_view uuid = id.substr(kGamePrefix.size());
        if (uuid.empty())
        {
            return std::nullopt;
        }
        return Activation{GameLaunch{std::string{uuid}}};
    }

    return std::nullopt;
}

FocusId ToFocusId(const Activation& activation)
{
    return std::visit(
        Overloaded{
            [](const ButtonActivation& button) { return MakeButtonId(button.kind); },
            [](const GameLaunch& launch) { return MakeGameId(launch.uuid); },
        },
        activation);
}

} // namespace hearth::focus
