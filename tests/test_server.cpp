#include <gtest/gtest.h>
#include "room_service.hpp"
#include "server.hpp"
#include "roomcast/frame.hpp"
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <future>
#include <memory>
#include <thread>
#include <vector>

using namespace roomcast;

namespace {

struct FileCloser {
    void operator()(FILE* f) const { std::fclose(f); }
};

// Throwaway self-signed certificate so the server can load a real TLS context
void write_self_signed(const std::string& cert_path, const std::string& key_path) {
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(EVP_EC_gen("P-256"), &EVP_PKEY_free);
    ASSERT_TRUE(key);

    std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), &X509_free);
    ASSERT_TRUE(cert);
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
    X509_set_pubkey(cert.get(), key.get());
    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);
    ASSERT_GT(X509_sign(cert.get(), key.get(), EVP_sha256()), 0);

    std::unique_ptr<FILE, FileCloser> cert_file(std::fopen(cert_path.c_str(), "w"));
    ASSERT_TRUE(cert_file);
    ASSERT_EQ(PEM_write_X509(cert_file.get(), cert.get()), 1);

    std::unique_ptr<FILE, FileCloser> key_file(std::fopen(key_path.c_str(), "w"));
    ASSERT_TRUE(key_file);
    ASSERT_EQ(PEM_write_PrivateKey(key_file.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr), 1);
}

wire::MessageWrapper read_frame(ssl::stream<tcp::socket>& stream) {
    std::array<uint8_t, frame::HEADER_SIZE> header;
    boost::asio::read(stream, boost::asio::buffer(header));
    std::string body(frame::decode_header(header), '\0');
    boost::asio::read(stream, boost::asio::buffer(&body[0], body.size()));

    wire::MessageWrapper msg;
    EXPECT_TRUE(msg.ParseFromString(body));
    return msg;
}

} // namespace

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.bind_address = "127.0.0.1";
        config_.port = 0;
        config_.certificate_file = ::testing::TempDir() + "roomcast_server_test_cert.pem";
        config_.private_key_file = ::testing::TempDir() + "roomcast_server_test_key.pem";
        write_self_signed(config_.certificate_file, config_.private_key_file);
    }

    void TearDown() override {
        io_context_.stop();
        join_workers();
        service_.reset();
        server_.reset();
        std::remove(config_.certificate_file.c_str());
        std::remove(config_.private_key_file.c_str());
    }

    void start_server() {
        server_ = std::make_unique<Server>(io_context_, config_, registry_);
        Scheduler scheduler = [this](std::function<void()> task) {
            boost::asio::post(io_context_, std::move(task));
        };
        service_ = std::make_unique<RoomService>(registry_, transfers_, *server_, scheduler);
        server_->set_handler(service_.get());
        server_->listen();
    }

    void run_workers(size_t count) {
        for (size_t i = 0; i < count; ++i) {
            workers_.emplace_back([this]() { io_context_.run(); });
        }
    }

    void join_workers() {
        for (auto& worker : workers_) {
            worker.join();
        }
        workers_.clear();
    }

    // Shuts the server down from a thread outside the pool and waits for it to finish
    bool shutdown_and_wait() {
        auto stopped = std::make_shared<std::promise<void>>();
        std::future<void> done = stopped->get_future();
        server_->shutdown([this, stopped]() {
            io_context_.stop();
            stopped->set_value();
        });
        return done.wait_for(std::chrono::seconds(10)) == std::future_status::ready;
    }

    ServerConfig config_;
    boost::asio::io_context io_context_;
    RoomRegistry registry_;
    TransferSessionManager transfers_;
    std::unique_ptr<Server> server_;
    std::unique_ptr<RoomService> service_;
    std::vector<std::thread> workers_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(ServerTest, SweepRunsAndShutdownCompletesAcrossWorkers) {
    start_server();
    EXPECT_NE(server_->local_port(), 0);

    auto first_sweep = std::make_shared<std::promise<void>>();
    std::future<void> swept = first_sweep->get_future();
    auto sweeps = std::make_shared<std::atomic<int>>(0);
    server_->start_sweeping(std::chrono::seconds(1), [first_sweep, sweeps]() {
        if (sweeps->fetch_add(1) == 0) {
            first_sweep->set_value();
        }
    });

    run_workers(4);
    ASSERT_EQ(swept.wait_for(std::chrono::seconds(10)), std::future_status::ready);

    EXPECT_TRUE(shutdown_and_wait());
    join_workers();
    EXPECT_GE(sweeps->load(), 1);
}

TEST_F(ServerTest, ShutdownBeforeAnySweepCancelsTheTimer) {
    start_server();
    server_->start_sweeping(std::chrono::seconds(3600), []() {});
    run_workers(4);

    EXPECT_TRUE(shutdown_and_wait());
    join_workers();
}

// ============================================================================
// TLS round trip
// ============================================================================

TEST_F(ServerTest, TlsClientGetsConnectionReadyAndCanCreateRoom) {
    start_server();
    unsigned short port = server_->local_port();
    run_workers(2);

    boost::asio::io_context client_io;
    ssl::context client_context(ssl::context::tls_client);
    client_context.set_verify_mode(ssl::verify_none);
    ssl::stream<tcp::socket> client(client_io, client_context);
    client.lowest_layer().connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    client.handshake(ssl::stream_base::client);

    wire::MessageWrapper ready = read_frame(client);
    ASSERT_EQ(ready.event_case(), wire::MessageWrapper::kConnectionReady);
    EXPECT_EQ(ready.connection_ready().connection_id(), "c-1");

    wire::MessageWrapper create;
    create.mutable_create_room();
    boost::asio::write(client, boost::asio::buffer(frame::encode(create)));

    wire::MessageWrapper created = read_frame(client);
    ASSERT_EQ(created.event_case(), wire::MessageWrapper::kRoomCreated);
    EXPECT_TRUE(registry_.room_exists(created.room_created().room_code()));
    EXPECT_EQ(server_->session_count(), 1u);

    EXPECT_TRUE(shutdown_and_wait());
    join_workers();
}
