#pragma once
#include "provider.hpp"
#include "tool.hpp"
#include "config.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace soulwire {

using ProviderFactory = std::function<std::shared_ptr<Provider>(const Config& config)>;
using ToolFactory = std::function<std::shared_ptr<Tool>()>;

// Providers and builtin tools, by name. Each plugin .cpp registers itself at
// static-init time through the registrars below; soulwire_core must stay an
// object library so none of them is dropped at link time. Thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_provider(const std::string& name, ProviderFactory factory);
    void register_tool(const std::string& name, ToolFactory factory);

    // Builds the provider registered under `name`.
    // Throws ConfigError listing the known providers for an unknown name.
    std::shared_ptr<Provider> create_provider(const std::string& name,
                                              const Config& config) const;

    // One fresh instance of every builtin tool, ordered by name.
    // A Runtime gets its own set; Hubs of one session share it.
    std::vector<std::shared_ptr<Tool>> builtin_tools() const;

    std::vector<std::string> provider_names() const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, ProviderFactory> providers_;
    std::map<std::string, ToolFactory> tools_;
};

struct ProviderRegistrar {
    ProviderRegistrar(const std::string& name, ProviderFactory factory) {
        PluginRegistry::instance().register_provider(name, std::move(factory));
    }
};

struct ToolRegistrar {
    ToolRegistrar(const std::string& name, ToolFactory factory) {
        PluginRegistry::instance().register_tool(name, std::move(factory));
    }
};

} // namespace soulwire
