#include <iostream>
#include <boost/asio.hpp>
#include <csignal>
#include <thread>
#include <vector>
#include "server.hpp"
#include "room_service.hpp"
#include "server_config.hpp"
#include "transfer_sessions.hpp"

int main(int argc, char* argv[]) {
    roomcast::ServerConfig config;
    try {
        config = roomcast::parse_arguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << roomcast::usage(argv[0]);
        return 1;
    }
    if (config.show_help) {
        std::cout << roomcast::usage(argv[0]);
        return 0;
    }

    try {
        boost::asio::io_context io_context;

        roomcast::RoomRegistry registry;
        roomcast::TransferSessionManager transfers;
        roomcast::Server server(io_context, config, registry);

        // Chunk emission yields back to the io_context between chunks
        roomcast::Scheduler scheduler = [&io_context](std::function<void()> task) {
            boost::asio::post(io_context, std::move(task));
        };
        roomcast::RoomService service(registry, transfers, server, scheduler, config.max_upload_bytes);
        server.set_handler(&service);

        server.listen();
        server.start_sweeping(config.sweep_interval, [&service, &config]() {
            service.expire_stale_uploads(std::chrono::steady_clock::now(), config.upload_session_ttl);
        });

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int signal) {
            std::cout << "[Server] Signal " << signal << " received, shutting down." << std::endl;
            server.shutdown([&io_context]() { io_context.stop(); });
        });

        std::cout << "[Server] Running with " << config.threads << " worker thread(s)" << std::endl;
        std::vector<std::thread> workers;
        for (size_t i = 1; i < config.threads; ++i) {
            workers.emplace_back([&io_context]() { io_context.run(); });
        }
        io_context.run();
        for (auto& worker : workers) {
            worker.join();
        }
    } catch (std::exception& e) {
        std::cerr << "Exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
