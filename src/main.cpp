/**
 * @file main.cpp
 * @brief convsync gateway executable.
 *
 * Usage:
 *   convsync_gateway [config.json] [database.db]
 *
 * Defaults: config/config.json and convsync.db in the working directory.
 * SIGINT / SIGTERM stop both servers.
 */

#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <convsync/App.hpp>

int main(int argc, char **argv)
{
    const std::string configPath = argc > 1 ? argv[1] : "config/config.json";
    const std::string dbPath = argc > 2 ? argv[2] : "convsync.db";

    try
    {
        convsync::App app{configPath, dbPath};

        boost::asio::io_context signalIoc{1};
        boost::asio::signal_set signals{signalIoc, SIGINT, SIGTERM};
        signals.async_wait(
            [&app](const boost::system::error_code &ec, int)
            {
                if (!ec)
                    app.stop();
            });
        std::thread signalThread([&signalIoc]()
                                 { signalIoc.run(); });

        app.run_blocking();

        signalIoc.stop();
        signalThread.join();
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[convsync_gateway] fatal: " << e.what() << std::endl;
        return 1;
    }
}
