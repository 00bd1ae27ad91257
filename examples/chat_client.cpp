#include <iostream>
#include <string>

#include <vix/config/Config.hpp>

#include <convsync/SyncClient.hpp>
#include <convsync/errors.hpp>

// Usage: chat_client <session_id> [host] [port] [cache.db]
int main(int argc, char **argv)
{
    if (argc < 2)
    {
        std::cerr << "usage: " << argv[0] << " <session_id> [host] [port] [cache.db]\n";
        return 1;
    }

    vix::config::Config cfg{"config/config.json"};

    convsync::SyncClient::Options opt;
    opt.sessionId = argv[1];
    if (argc > 2)
        opt.host = argv[2];
    if (argc > 3)
        opt.port = argv[3];
    opt.cachePath = argc > 4 ? argv[4] : "chat_cache.db";
    opt.config = convsync::ClientConfig::from_core(cfg);

    try
    {
        convsync::SyncClient client(opt);

        client.on_state_change([](convsync::ConnectionState, convsync::ConnectionState to)
                               { std::cout << "[client] " << convsync::to_string(to) << std::endl; });

        client.on_update([](const std::vector<convsync::CachedMessage> &messages)
                         {
            if (messages.empty())
                return;

            const auto &last = messages.back();
            std::cout << "[" << convsync::to_string(last.role) << "]"
                      << (last.sync_state == convsync::SyncState::Pending ? " (pending) " : " ")
                      << last.content << std::endl; });

        client.start();

        for (const auto &m : client.messages())
            std::cout << "[cached][" << convsync::to_string(m.role) << "] " << m.content << std::endl;

        std::cout << "Type messages, /reset to clear the local cache, /quit to exit\n";

        for (std::string line; std::getline(std::cin, line);)
        {
            if (line == "/quit")
                break;

            if (line == "/reset")
            {
                client.reset_session();
                continue;
            }

            if (line.empty())
                continue;

            client.send_message("user", line).get();
        }

        client.close();
    }
    catch (const convsync::SyncError &e)
    {
        std::cerr << "[client] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
