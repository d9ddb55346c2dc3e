#include "app/application.hpp"

#include "core/home_config.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string_view>

int main(int argc, char** argv)
{
    std::filesystem::path configPath = hearth::config::DefaultPath();
    for (int index = 1; index < argc; ++index)
    {
        const std::string_view argument{argv[index]};
        if (argument == "--config" && index + 1 < argc)
        {
            configPath = argv[++index];
        }
        else
        {
            std::cerr << "Usage: hearth [--config <path>]\n";
            return EXIT_FAILURE;
        }
    }

    hearth::Application app{configPath};
    return app.Run();
}
