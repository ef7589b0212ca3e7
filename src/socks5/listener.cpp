#include "listener.hpp"

#include <userver/components/component_config.hpp>
#include <userver/components/component_context.hpp>
#include <userver/yaml_config/merge_schemas.hpp>

using namespace std::chrono_literals;

namespace socksrelay::socks5 {

namespace {

ServerConfig ParseServerConfig(const userver::components::ComponentConfig& config) {
    ServerConfig server_config;
    server_config.listen_address = config["listen-address"].As<std::string>("::");
    server_config.port = config["port"].As<uint16_t>(6000);
    server_config.connect_timeout = config["connect-timeout"].As<std::chrono::milliseconds>(10s);
    server_config.connection.handshake_timeout = config["handshake-timeout"].As<std::chrono::milliseconds>(10s);
    server_config.connection.relay_buffer_size = config["relay-buffer-size"].As<std::size_t>(4096);
    return server_config;
}

}  // namespace

Listener::Listener(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context
)
    : ComponentBase(config, context),
      server_{
          ParseServerConfig(config),
          context.GetTaskProcessor(config["fs-task-processor"].As<std::string>("fs-task-processor"))
      } {
    server_.Listen();
}

Listener::~Listener() = default;

void Listener::OnAllComponentsLoaded() { server_.Start(); }

void Listener::OnAllComponentsAreStopping() { server_.Stop(); }

userver::yaml_config::Schema Listener::GetStaticConfigSchema() {
    return userver::yaml_config::MergeSchemas<userver::components::ComponentBase>(R"(
        type: object
        description: SOCKS5 proxy listener
        additionalProperties: false
        properties:
            listen-address:
                type: string
                description: IPv4 or IPv6 literal to bind, '::' accepts both families
                defaultDescription: '::'
            port:
                type: integer
                description: TCP port to listen on, 0 picks an ephemeral port
                defaultDescription: 6000
            handshake-timeout:
                type: string
                description: time to handle the SOCKS5 negotiation, request and reply
                defaultDescription: 10s
            connect-timeout:
                type: string
                description: time to resolve and connect to the requested target
                defaultDescription: 10s
            relay-buffer-size:
                type: integer
                description: size of the copy buffer for each relay direction
                defaultDescription: 4096
            fs-task-processor:
                type: string
                description: task processor for blocking name resolution
                defaultDescription: fs-task-processor
  )");
}

}  // namespace socksrelay::socks5
