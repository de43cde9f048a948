#include "polyglot/config/LanguageSettings.hpp"
#include "polyglot/core/Errors.hpp"
#include "polyglot/core/KeyEncoder.hpp"
#include "polyglot/engine/EngineRegistry.hpp"
#include "polyglot/language/LanguageCoordinator.hpp"
#include "polyglot/language/LanguageServer.hpp"
#include "polyglot/model/TreeLoader.hpp"
#include "polyglot/model/TypeRegistry.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace
{
constexpr char kUsage[] =
    "Usage:\n"
    "  polyglot-cli hash <text>\n"
    "  polyglot-cli save <settings.json> <tree.json>\n"
    "  polyglot-cli load <settings.json> <tree.json>\n"
    "  polyglot-cli translate <settings.json> <text>\n"
    "  polyglot-cli info <settings.json>\n";

polyglot::config::LanguageSettings ReadSettings(const std::filesystem::path& path)
{
    auto settings = polyglot::config::loadSettings(path);
    polyglot::config::applyEnvironmentOverrides(settings);
    return settings;
}

int RunTreeCommand(const std::string& command, const std::vector<std::string>& args)
{
    const auto settings = ReadSettings(args[0]);

    polyglot::engine::EngineRegistry engines;
    polyglot::engine::registerBuiltinEngines(engines);

    polyglot::model::TypeRegistry types;
    polyglot::model::TreeLoader loader{types};
    const auto root = loader.loadFromFile(args[1]);

    auto coordinatorSettings = settings;
    coordinatorSettings.registerOnStart = false;
    polyglot::language::LanguageCoordinator coordinator{*root, engines, nullptr, coordinatorSettings};

    bool failed = false;
    coordinator.onError([&failed](const std::string& message) {
        std::cerr << "[Polyglot] " << message << '\n';
        failed = true;
    });

    if (coordinator.filePath().empty())
    {
        std::cerr << "[Polyglot] Settings must name a root path and a language\n";
        return EXIT_FAILURE;
    }

    if (command == "save")
    {
        if (!coordinator.save() || failed)
        {
            return EXIT_FAILURE;
        }
        std::cout << coordinator.filePath().string() << '\n';
        return EXIT_SUCCESS;
    }

    if (!coordinator.load() || failed)
    {
        return EXIT_FAILURE;
    }
    for (const auto& line : polyglot::model::describeAttributes(*root))
    {
        std::cout << line << '\n';
    }
    return EXIT_SUCCESS;
}

int RunServerCommand(const std::string& command, const std::vector<std::string>& args)
{
    const auto settings = ReadSettings(args[0]);

    polyglot::engine::EngineRegistry engines;
    polyglot::engine::registerBuiltinEngines(engines);

    polyglot::language::LanguageServer server{engines, settings.format};
    server.setRootPath(settings.rootPath);
    server.setLanguage(settings.language);
    if (!server.canSync())
    {
        std::cerr << "[Polyglot] Language folder not found: " << (settings.rootPath / settings.language).string()
                  << '\n';
        return EXIT_FAILURE;
    }

    if (command == "translate")
    {
        std::cout << server.translate(args[1]) << '\n';
        return EXIT_SUCCESS;
    }

    const auto info = server.languageInfo();
    std::cout << "Id=" << info.id << '\n'
              << "Name=" << info.name << '\n'
              << "NativeName=" << info.nativeName << '\n'
              << "IsRightToLeft=" << (info.rightToLeft ? "true" : "false") << '\n'
              << "UIFont=" << info.uiFont << '\n'
              << "FallbackFont=" << info.fallbackFont << '\n';
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        std::cerr << kUsage;
        return EXIT_FAILURE;
    }

    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    try
    {
        if (command == "hash" && args.size() == 1)
        {
            std::cout << polyglot::core::KeyEncoder::makeKey(args[0]) << '\n';
            return EXIT_SUCCESS;
        }
        if ((command == "save" || command == "load") && args.size() == 2)
        {
            return RunTreeCommand(command, args);
        }
        if (command == "translate" && args.size() == 2)
        {
            return RunServerCommand(command, args);
        }
        if (command == "info" && args.size() == 1)
        {
            return RunServerCommand(command, args);
        }
    }
    catch (const std::exception& ex)
    {
        std::cerr << "[Polyglot] " << ex.what() << '\n';
        return EXIT_FAILURE;
    }

    std::cerr << kUsage;
    return EXIT_FAILURE;
}
