#include "plugin.hpp"
#include "errors.hpp"

namespace soulwire {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_provider(const std::string& name, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[name] = std::move(factory);
}

void PluginRegistry::register_tool(const std::string& name, ToolFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_[name] = std::move(factory);
}

std::shared_ptr<Provider> PluginRegistry::create_provider(const std::string& name,
                                                          const Config& config) const {
    ProviderFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = providers_.find(name);
        if (it != providers_.end()) factory = it->second;
    }
    if (!factory) {
        std::string known;
        for (const auto& n : provider_names()) {
            known += known.empty() ? n : ", " + n;
        }
        throw ConfigError("unknown provider \"" + name + "\" (available: " + known + ")");
    }
    auto provider = factory(config);
    if (!provider) {
        throw ConfigError("provider \"" + name + "\" could not be created");
    }
    return provider;
}

std::vector<std::shared_ptr<Tool>> PluginRegistry::builtin_tools() const {
    std::vector<ToolFactory> factories;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : tools_) factories.push_back(entry.second);
    }
    std::vector<std::shared_ptr<Tool>> tools;
    tools.reserve(factories.size());
    for (const auto& make : factories) {
        if (auto tool = make()) tools.push_back(std::move(tool));
    }
    return tools;
}

std::vector<std::string> PluginRegistry::provider_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(providers_.size());
    for (const auto& entry : providers_) names.push_back(entry.first);
    return names;
}

} // namespace soulwire
