#include "polyglot/engine/EngineRegistry.hpp"

#include "polyglot/core/Errors.hpp"
#include "polyglot/engine/IniFormat.hpp"
#include "polyglot/engine/JsonFormat.hpp"

#include <exception>

namespace polyglot::engine {

void EngineRegistry::registerEngine(core::PersistenceFormat format,
                                    const std::string &engineName,
                                    EngineFactory factory) {
    if (!factory) {
        throw core::ConfigurationError("Engine " + engineName + " has no factory");
    }

    std::unique_ptr<TranslationEngine> probe;
    try {
        probe = factory();
    } catch (const std::exception &error) {
        throw core::ConfigurationError("Engine " + engineName + " could not be created: " + error.what());
    }

    if (!probe) {
        throw core::ConfigurationError("Engine " + engineName + " did not produce an engine");
    }
    if (probe->format() != format) {
        throw core::ConfigurationError("Engine " + engineName + " does not implement format " +
                                       core::toString(format));
    }

    factories_.try_emplace(format, Registration{engineName, std::move(factory)});
}

void EngineRegistry::unregisterEngine(core::PersistenceFormat format) {
    factories_.erase(format);
}

bool EngineRegistry::hasEngine(core::PersistenceFormat format) const {
    return factories_.find(format) != factories_.end();
}

std::string EngineRegistry::engineName(core::PersistenceFormat format) const {
    auto it = factories_.find(format);
    if (it == factories_.end()) {
        return {};
    }
    return it->second.name;
}

std::unique_ptr<TranslationEngine> EngineRegistry::create(core::PersistenceFormat format) const {
    auto it = factories_.find(format);
    if (it == factories_.end()) {
        throw core::ConfigurationError("No engine registered for format: " + core::toString(format));
    }

    auto engine = (it->second.factory)();
    if (!engine) {
        throw core::ConfigurationError("Engine " + it->second.name + " did not produce an engine");
    }
    return engine;
}

void registerBuiltinEngines(EngineRegistry &registry) {
    registry.registerEngine(core::PersistenceFormat::Json, "JsonEngine", [] {
        return std::make_unique<TranslationEngine>(std::make_unique<JsonFormat>());
    });
    registry.registerEngine(core::PersistenceFormat::Ini, "IniEngine", [] {
        return std::make_unique<TranslationEngine>(std::make_unique<IniFormat>(IniFormat::Layout::Hierarchical));
    });
    registry.registerEngine(core::PersistenceFormat::IniFlat, "IniFlatEngine", [] {
        return std::make_unique<TranslationEngine>(std::make_unique<IniFormat>(IniFormat::Layout::Flat));
    });
}

} // namespace polyglot::engine
