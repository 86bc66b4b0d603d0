#include "ControlClient.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

namespace
{
    using net_recon::protocol::MessageType;

    void PrintUsage()
    {
        std::cout << "Usage: netrecon-ctl [--host H] [--port P] <command> [args]\n"
                     "  scan <cidr>                     start a subnet scan\n"
                     "  scans [limit] [offset]          list scans, newest first\n"
                     "  scan-get <id>                   show one scan and its devices\n"
                     "  topology                        dump devices and links\n"
                     "  traceroute <target> [hops] [timeout_ms]\n"
                     "  ping                            check the daemon is alive\n";
    }

    bool ParseInt(const std::string &text, int &out)
    {
        try
        {
            size_t used = 0;
            out = std::stoi(text, &used);
            return used == text.size();
        }
        catch (const std::exception &)
        {
            return false;
        }
    }
}

int main(int argc, char *argv[])
{
    std::string host = "127.0.0.1";
    int port = 8080;

    int i = 1;
    for (; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--host" && i + 1 < argc)
            host = argv[++i];
        else if (arg == "--port" && i + 1 < argc)
        {
            if (!ParseInt(argv[++i], port))
            {
                std::cerr << "Invalid port\n";
                return 2;
            }
        }
        else
            break;
    }

    if (i >= argc)
    {
        PrintUsage();
        return 2;
    }

    std::string command = argv[i++];
    int remaining = argc - i;

    MessageType type;
    nlohmann::json body = nlohmann::json::object();

    if (command == "scan" && remaining == 1)
    {
        type = MessageType::ScanStartReq;
        body["subnet"] = argv[i];
    }
    else if (command == "scans" && remaining <= 2)
    {
        type = MessageType::ScanListReq;
        int value = 0;
        if (remaining >= 1)
        {
            if (!ParseInt(argv[i], value))
            {
                PrintUsage();
                return 2;
            }
            body["limit"] = value;
        }
        if (remaining == 2)
        {
            if (!ParseInt(argv[i + 1], value))
            {
                PrintUsage();
                return 2;
            }
            body["offset"] = value;
        }
    }
    else if (command == "scan-get" && remaining == 1)
    {
        type = MessageType::ScanGetReq;
        body["id"] = argv[i];
    }
    else if (command == "topology" && remaining == 0)
    {
        type = MessageType::TopologyReq;
    }
    else if (command == "traceroute" && remaining >= 1 && remaining <= 3)
    {
        type = MessageType::TracerouteReq;
        body["target"] = argv[i];
        int value = 0;
        if (remaining >= 2)
        {
            if (!ParseInt(argv[i + 1], value))
            {
                PrintUsage();
                return 2;
            }
            body["max_hops"] = value;
        }
        if (remaining == 3)
        {
            if (!ParseInt(argv[i + 2], value))
            {
                PrintUsage();
                return 2;
            }
            body["timeout_ms"] = value;
        }
    }
    else if (command == "ping" && remaining == 0)
    {
        type = MessageType::HeartbeatReq;
    }
    else
    {
        PrintUsage();
        return 2;
    }

    net_recon::agent::ControlClient client(host, port);
    if (!client.Connect())
    {
        std::cerr << "[Client] Could not reach " << host << ":" << port << "\n";
        return 1;
    }

    auto reply = client.Call(type, body.dump());
    if (!reply)
        return 1;

    const auto &response = reply->response;
    try
    {
        std::cout << nlohmann::json::parse(response.body).dump(2) << "\n";
    }
    catch (const nlohmann::json::parse_error &)
    {
        std::cout << response.body << "\n";
    }

    return response.status < 400 ? 0 : 1;
}
