#include "app/application.hpp"

#include "core/game_library.hpp"
#include "hearth/model/HomeScreenModel.hpp"
#include "ui/home_view.hpp"
#include "ui/theme.hpp"
#include "utils/asset_paths.hpp"
#include "utils/font_manager.hpp"

#include <SDL2/SDL_ttf.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <utility>
#include <variant>

namespace hearth
{

Application::Application(std::filesystem::path configPath) : configPath_(std::move(configPath)) {}

Application::~Application() = default;

int Application::Run()
{
    if (!LoadConfiguration())
    {
        return EXIT_FAILURE;
    }

    if (!rendererHost_.Init(config_.window.title.c_str(), config_.window.width, config_.window.height))
    {
        return EXIT_FAILURE;
    }

    if (!InitializeFonts() || !LoadGames())
    {
        return EXIT_FAILURE;
    }

    InitializeModel();
    InitializeInput();

    bool running = true;
    SDL_Event event{};
    while (running)
    {
        while (SDL_PollEvent(&event))
        {
            inputRouter_.Dispatch(event, running);
        }

        SyncViewport();
        RenderFrame();
    }

    return EXIT_SUCCESS;
}

bool Application::LoadConfiguration()
{
    try
    {
        config_ = config::Load(paths::ResolveAssetPath(configPath_));
    }
    catch (const std::exception& ex)
    {
        std::cerr << "[Hearth] " << ex.what() << '\n';
        return false;
    }
    return true;
}

bool Application::InitializeFonts()
{
    const std::string fontPath = fonts::ResolveFontPath(config_.fontPath);
    if (fontPath.empty())
    {
        std::cerr << "[Hearth] Unable to locate a usable font file. Provide DejaVuSans.ttf in assets/fonts or set "
                     "HEARTH_FONT_PATH.\n";
        return false;
    }

    font_ = sdl::FontHandle{TTF_OpenFont(fontPath.c_str(), config_.fontSize)};
    if (!font_)
    {
        std::cerr << "[Hearth] Failed to load font from " << fontPath << ": " << TTF_GetError() << '\n';
        return false;
    }
    return true;
}

bool Application::LoadGames()
{
    const std::filesystem::path libraryPath = paths::ResolveAssetPath(config_.libraryPath);
    try
    {
        library_ = LoadGameLibrary(libraryPath.string());
    }
    catch (const std::exception& ex)
    {
        std::cerr << "[Hearth] " << ex.what() << '\n';
        return false;
    }

    std::cerr << "[Hearth] Loaded " << library_.size() << " games from " << libraryPath.string() << ".\n";
    return true;
}

void Application::InitializeModel()
{
    model_ = std::make_unique<model::HomeScreenModel>(config_.grid);
    model_->Activations().OnActivation([this](const focus::Activation& activation) { HandleActivation(activation); });
    model_->ReplaceGames(model::ToGameData(library_));

    view_ = std::make_unique<ui::HomeView>(
        rendererHost_.Renderer(), font_.get(), ui::DefaultHomeTheme(), config_.titleBarHeight);
    if (!config_.backgroundPath.empty())
    {
        if (!view_->LoadBackground(paths::ResolveAssetPath(config_.backgroundPath)))
        {
            std::cerr << "[Hearth] Drawing the gradient background instead.\n";
        }
    }
}

void Application::InitializeInput()
{
    homeInputHandler_ = std::make_unique<input::HomeInputHandler>(
        *model_, [this](int x, int y) { return view_->HitTest(x, y); });
    homeInputHandler_->Register(inputRouter_);

    inputRouter_.RegisterHandler(SDL_CONTROLLERDEVICEADDED, [this](const SDL_Event& event, bool&) {
        OpenController(event.cdevice.which);
        return true;
    });
    inputRouter_.RegisterHandler(SDL_CONTROLLERDEVICEREMOVED, [this](const SDL_Event& event, bool&) {
        CloseController(event.cdevice.which);
        return true;
    });

    // Controllers present at start-up also arrive as SDL_CONTROLLERDEVICEADDED.
}

void Application::OpenController(int deviceIndex)
{
    if (!SDL_IsGameController(deviceIndex))
    {
        return;
    }

    sdl::GameControllerHandle controller{SDL_GameControllerOpen(deviceIndex)};
    if (!controller)
    {
        std::cerr << "[Input] Failed to open game controller " << deviceIndex << ": " << SDL_GetError() << '\n';
        return;
    }

    const SDL_JoystickID instanceId = SDL_JoystickInstanceID(SDL_GameControllerGetJoystick(controller.get()));
    if (controllers_.find(instanceId) != controllers_.end())
    {
        return;
    }

    const char* name = SDL_GameControllerName(controller.get());
    std::cerr << "[Input] Game controller connected: " << (name != nullptr ? name : "unknown") << '\n';
    controllers_.emplace(instanceId, std::move(controller));
}

void Application::CloseController(SDL_JoystickID instanceId)
{
    if (controllers_.erase(instanceId) > 0)
    {
        std::cerr << "[Input] Game controller disconnected.\n";
    }
}

void Application::HandleActivation(const focus::Activation& activation)
{
    std::visit(
        focus::Overloaded{
            [](const focus::ButtonActivation& button) {
                std::cerr << "[Hearth] Button activated: " << focus::ToString(button.kind) << '\n';
            },
            [this](const focus::GameLaunch& launch) {
                const model::GameMetadata* game = model::FindGame(library_, launch.uuid);
                if (game == nullptr)
                {
                    std::cerr << "[Hearth] Launch requested for unknown game '" << launch.uuid << "'.\n";
                    return;
                }
                std::cerr << "[Hearth] Launch requested: " << game->title << " (" << launch.uuid << ")";
                if (game->installSource)
                {
                    std::cerr << " via " << *game->installSource;
                }
                std::cerr << '\n';
            },
        },
        activation);
}

void Application::SyncViewport()
{
    const auto output = rendererHost_.OutputSize();
    if (output.width == viewportWidth_ && output.height == viewportHeight_)
    {
        return;
    }

    viewportWidth_ = output.width;
    viewportHeight_ = output.height;
    const SDL_Rect games = view_->GamesViewport(viewportWidth_, viewportHeight_);
    model_->Resize(static_cast<float>(games.w), static_cast<float>(games.h));
}

void Application::RenderFrame()
{
    SDL_Renderer* renderer = rendererHost_.Renderer();
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, SDL_ALPHA_OPAQUE);
    SDL_RenderClear(renderer);
    view_->Render(*model_, viewportWidth_, viewportHeight_);
    SDL_RenderPresent(renderer);
}

} // namespace hearth
