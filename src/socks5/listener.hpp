#pragma once

#include "socks5/server.hpp"

#include <userver/components/component_base.hpp>
#include <userver/yaml_config/schema.hpp>

#include <string_view>

namespace socksrelay::socks5 {

class Listener final : public userver::components::ComponentBase {
public:
    static constexpr std::string_view kName = "socks5-listener";

    Listener(const userver::components::ComponentConfig& config, const userver::components::ComponentContext& context);
    ~Listener() override;

    static userver::yaml_config::Schema GetStaticConfigSchema();

private:
    void OnAllComponentsLoaded() override;
    void OnAllComponentsAreStopping() override;

    Server server_;
};

}  // namespace socksrelay::socks5
