#pragma once

#include "polyglot/core/PersistenceFormat.hpp"
#include "polyglot/engine/TranslationEngine.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace polyglot::engine {

/**
 * @brief Maps persistence formats to engine factories.
 *
 * Every factory is invoked once when registered to check that it produces an
 * engine for the format it is registered under. The first registration of a
 * format wins; later ones are ignored.
 */
class EngineRegistry {
public:
    using EngineFactory = std::function<std::unique_ptr<TranslationEngine>()>;

    // Throws ConfigurationError when the factory fails its probe.
    void registerEngine(core::PersistenceFormat format, const std::string &engineName, EngineFactory factory);
    void unregisterEngine(core::PersistenceFormat format);

    [[nodiscard]] bool hasEngine(core::PersistenceFormat format) const;
    [[nodiscard]] std::string engineName(core::PersistenceFormat format) const;

    // Fresh engine on every call. Throws ConfigurationError for an unknown format.
    std::unique_ptr<TranslationEngine> create(core::PersistenceFormat format) const;

private:
    struct Registration {
        std::string name;
        EngineFactory factory;
    };

    std::map<core::PersistenceFormat, Registration> factories_;
};

// Registers JsonEngine, IniEngine and IniFlatEngine.
void registerBuiltinEngines(EngineRegistry &registry);

} // namespace polyglot::engine
