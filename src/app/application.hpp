#pragma once

#include "core/home_config.hpp"
#include "hearth/focus/FocusId.hpp"
#include "hearth/model/Game.hpp"
#include "input/home_input_handler.hpp"
#include "input/input_router.h"
#include "platform/renderer_host.hpp"
#include "utils/sdl_wrappers.hpp"

#include <SDL2/SDL.h>

#include <filesystem>
#include <memory>
#include <unordered_map>
#include <vector>

namespace hearth::model
{
class HomeScreenModel;
}

namespace hearth::ui
{
class HomeView;
}

namespace hearth
{

class Application
{
  public:
    explicit Application(std::filesystem::path configPath);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    int Run();

  private:
    [[nodiscard]] bool LoadConfiguration();
    [[nodiscard]] bool InitializeFonts();
    [[nodiscard]] bool LoadGames();
    void InitializeModel();
    void InitializeInput();
    void OpenController(int deviceIndex);
    void CloseController(SDL_JoystickID instanceId);
    void HandleActivation(const focus::Activation& activation);
    void SyncViewport();
    void RenderFrame();

    std::filesystem::path configPath_;
    // Outlives every SDL resource declared below it.
    platform::RendererHost rendererHost_;
    config::HomeConfig config_;
    sdl::FontHandle font_;
    std::vector<model::GameMetadata> library_;
    std::unique_ptr<model::HomeScreenModel> model_;
    std::unique_ptr<ui::HomeView> view_;
    input::InputRouter inputRouter_;
    std::unique_ptr<input::HomeInputHandler> homeInputHandler_;
    std::unordered_map<SDL_JoystickID, sdl::GameControllerHandle> controllers_;
    int viewportWidth_ = -1;
    int viewportHeight_ = -1;
};

} // namespace hearth
