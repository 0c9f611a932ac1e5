#include <memory>
#include <string>

#include "bridge/connections_bridge.hpp"
#include "ctl/ipc.hpp"
#include "events/event_cache.hpp"
#include "provider/bluez_provider.hpp"
#include "provider/loopback_provider.hpp"
#include "rpc/dispatcher.hpp"
#include "util/config.hpp"
#include "util/ids.hpp"
#include "util/log.hpp"

static std::unique_ptr<provider::IConnectionsProvider> make_provider(const config::Config &cfg)
{
    if (cfg.provider == config::ProviderKind::Bluez)
    {
        provider::BluezSettings s;
        s.adapter = cfg.adapter;
        return std::make_unique<provider::BluezProvider>(std::move(s));
    }
    // default - loopback
    provider::LoopbackSettings s;
    s.receive_dir = cfg.payload_dir;
    return std::make_unique<provider::LoopbackProvider>(std::move(s));
}

int main()
{
    config::Config cfg = config::load_from_env();
    ncbridge::set_log_level_by_name(cfg.log_level.c_str());

    if (!ids::init())
        return 1;

    LOG_SYSTEM("Config: provider=%s adapter=%s payload_dir=%s queue_limit=%zu",
               config::provider_kind_name(cfg.provider), cfg.adapter.c_str(),
               cfg.payload_dir.c_str(), cfg.event_queue_limit);

    auto               prov = make_provider(cfg);
    events::EventCache cache(cfg.event_queue_limit);
    bridge::ConnectionsBridge bridge(*prov, cache, cfg.payload_dir);
    rpc::Dispatcher           dispatcher(bridge, cache);

    LOG_SYSTEM("Local endpoint %s (%s provider)", prov->local_endpoint_id().c_str(),
               prov->name().c_str());

    const bool served = ipc::start_server(
        cfg.ctl_sock, [&dispatcher](const std::string &line) { return dispatcher.handle(line); });

    bridge.stop_all_endpoints();
    // join provider threads while the trackers' sink and store are still alive
    prov.reset();
    if (!served)
    {
        LOG_ERROR("start_server failed");
        return 1;
    }
    LOG_SYSTEM("Received QUIT command, exiting...");
    return 0;
}
