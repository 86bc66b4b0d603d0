#include "NetworkCore.hpp"
#include "ReconConfig.hpp"
#include "ReconService.hpp"
#include "SqliteDeviceStore.hpp"
#include "Worker.hpp"

#include "../recon/ArpReader.hpp"
#include "../recon/Errors.hpp"
#include "../recon/EventBus.hpp"
#include "../recon/LocalInterface.hpp"
#include "../recon/MdnsListener.hpp"
#include "../recon/OuiLookup.hpp"
#include "../recon/Pinger.hpp"
#include "../recon/Platform.hpp"
#include "../recon/Resolver.hpp"
#include "../recon/ScanOrchestrator.hpp"
#include "../recon/Traceroute.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace
{
    net_recon::server::NetworkCore *g_core = nullptr;

    void HandleSignal(int)
    {
        if (g_core)
            g_core->Stop();
    }

    void LogEvent(const net_recon::recon::Event &event)
    {
        std::cout << "[Events] " << event.topic;
        if (event.device)
            std::cout << " " << event.device->id << " " << event.device->PrimaryIp();
        if (event.scan)
            std::cout << " " << event.scan->id << " " << event.scan->subnet << " "
                      << net_recon::recon::ToString(event.scan->status);
        if (event.lost)
            std::cout << " " << event.lost->device_id << " " << event.lost->ip;
        std::cout << std::endl;
    }
}

int main(int argc, char *argv[])
{
    using namespace net_recon;

    server::ReconConfig config;
    try
    {
        config = server::ReconConfig::Load(argc > 1 ? argv[1] : "");
    }
    catch (const recon::ConfigError &e)
    {
        std::cerr << "[Config] " << e.what() << '\n';
        return 2;
    }

    recon::Platform platform = recon::CurrentPlatform();
    std::cout << "[Server] Platform: " << recon::PlatformName(platform) << std::endl;

    server::SqliteDeviceStore store;
    try
    {
        store.Initialize(config.database_path);
    }
    catch (const recon::StoreError &e)
    {
        std::cerr << "[DB] " << e.what() << '\n';
        return 1;
    }

    recon::InProcessEventBus events;
    events.Subscribe("", LogEvent);

    recon::IcmpPinger pinger(platform);
    recon::SystemArpReader arp(platform);
    recon::OuiTable oui(config.oui_path);
    recon::TinsInterfaceProvider interfaces;

    recon::ScanOptions scanOptions;
    scanOptions.max_concurrency = config.scan_max_concurrency;
    scanOptions.ping_timeout = config.scan_ping_timeout;
    scanOptions.max_hosts = config.scan_max_hosts;
    recon::ScanOrchestrator scanner(store, events, pinger, arp, oui, interfaces, scanOptions);

    recon::TracerouteOptions traceOptions;
    traceOptions.max_hops = recon::ClampMaxHops(config.traceroute_max_hops);
    traceOptions.hop_timeout = recon::ClampHopTimeout(config.traceroute_timeout);
    recon::TracerouteEngine traceroute(platform, std::make_shared<recon::SystemResolver>(), traceOptions);

    server::ReconService service(store, scanner, traceroute);
    server::Worker worker(service, config.worker_threads);
    server::NetworkCore core(config.control_port, config.tls_cert, config.tls_key);

    worker.SetNetworkCore(&core);
    core.SetWorker(&worker);

    recon::CancelSource mdnsCancel;
    std::thread mdnsThread;

    int exit_code = 0;
    try
    {
        core.Init();

        g_core = &core;
        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);
        std::signal(SIGPIPE, SIG_IGN);

        worker.Start();

        if (config.mdns_enabled)
        {
            auto listener = std::make_shared<recon::MdnsListener>(store, events, recon::MakeMdnsQuerier(platform),
                                                                  config.mdns_interval, config.mdns_query_timeout);
            recon::CancelToken token = mdnsCancel.Token();
            mdnsThread = std::thread([listener, token]() { listener->Run(token); });
        }

        core.Run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Server Error: " << e.what() << '\n';
        exit_code = 1;
    }

    g_core = nullptr;
    std::cout << "[Server] Shutting down" << std::endl;

    service.Shutdown();
    mdnsCancel.Cancel();
    if (mdnsThread.joinable())
        mdnsThread.join();
    scanner.Shutdown();
    worker.Stop();
    store.Shutdown();

    return exit_code;
}
