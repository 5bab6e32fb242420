#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Process.h>

#include <chrono>
#include <ctime>
#include <exception>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "chunkshare/auth/jwt_codec.h"
#include "chunkshare/metadata/sqlite_repository.h"

namespace {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

constexpr const char* kHost = "127.0.0.1";
constexpr const char* kSecret = "integration-test-secret-0123456789";

class ServerProcess {
public:
    explicit ServerProcess(Poco::ProcessHandle handle) : handle_(std::move(handle)) {}

    ~ServerProcess() {
        try {
            if (Poco::Process::isRunning(handle_)) {
                Poco::Process::kill(handle_);
                Poco::Process::wait(handle_);
            }
        } catch (const std::exception&) {
            // Best-effort shutdown; test cleanup should not throw.
        }
    }

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

private:
    Poco::ProcessHandle handle_;
};

unsigned short FindFreePort() {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, {tcp::v4(), 0});
    return acceptor.local_endpoint().port();
}

std::filesystem::path MakeTempDir() {
    const auto base = std::filesystem::temp_directory_path();
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto pid = static_cast<long>(getpid());
    const std::string name = "chunkshare_it_" + std::to_string(pid) + "_" + std::to_string(now);
    auto dir = base / name;
    std::filesystem::create_directories(dir);
    return dir;
}

void CleanupTempDir(const std::filesystem::path& dir) {
    std::error_code ec;
    for (int i = 0; i < 5; ++i) {
        std::filesystem::remove_all(dir, ec);
        if (!ec) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

std::filesystem::path WriteServerConfig(const std::filesystem::path& dir, unsigned short port) {
    const auto storage_dir = dir / "storage";

    const auto config_path = dir / "server.json";
    std::ofstream out(config_path);
    out << "{\n"
        << "  \"server\": {\n"
        << "    \"host\": \"127.0.0.1\",\n"
        << "    \"port\": " << port << ",\n"
        << "    \"threads\": 2,\n"
        << "    \"limits\": { \"max_body_bytes\": 1048576 }\n"
        << "  },\n"
        << "  \"storage\": {\n"
        << "    \"root\": \"" << storage_dir.generic_string() << "\"\n"
        << "  },\n"
        << "  \"uploads\": {\n"
        << "    \"max_chunk_size\": 1024,\n"
        << "    \"default_chunk_size\": 4,\n"
        << "    \"finalize_workers\": 1\n"
        << "  },\n"
        << "  \"links\": { \"password_iterations\": 1000 },\n"
        << "  \"auth\": { \"token_secret\": \"" << kSecret << "\" },\n"
        << "  \"observability\": { \"log_level\": \"warning\" }\n"
        << "}\n";
    return config_path;
}

std::filesystem::path WriteDatabaseConfig(const std::filesystem::path& dir,
                                          const std::filesystem::path& db_path) {
    const auto config_path = dir / "database.json";
    std::ofstream out(config_path);
    out << "{\n"
        << "  \"sqlite\": {\n"
        << "    \"path\": \"" << db_path.generic_string() << "\"\n"
        << "  }\n"
        << "}\n";
    return config_path;
}

// Principals are provisioned outside the server; seed one straight into its database.
void SeedPrincipal(const std::filesystem::path& db_path, const std::string& id) {
    chunkshare::metadata::SqliteRepository repository(db_path.string());
    chunkshare::metadata::Principal principal;
    principal.id = id;
    principal.quota_bytes = 1024 * 1024;
    ASSERT_TRUE(repository.CreatePrincipal(principal).ok());
}

std::string BearerFor(const std::string& subject) {
    chunkshare::auth::JwtCodec codec(kSecret, 60);
    const auto now = static_cast<Poco::Int64>(std::time(nullptr));
    Poco::JSON::Object claims;
    claims.set("sub", subject);
    claims.set("iat", now);
    claims.set("exp", now + 300);
    return "Bearer " + codec.Sign(claims);
}

http::response<http::string_body> SendRequest(
    http::verb method,
    unsigned short port,
    const std::string& target,
    const std::string& body,
    const std::string& content_type,
    const std::vector<std::pair<std::string, std::string>>& headers = {}) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    auto const results = resolver.resolve(kHost, std::to_string(port));
    stream.connect(results);

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, kHost);
    req.set(http::field::user_agent, "chunkshare-integration-tests");
    if (!content_type.empty()) {
        req.set(http::field::content_type, content_type);
    }
    for (const auto& header : headers) {
        req.set(header.first, header.second);
    }
    req.body() = body;
    req.prepare_payload();

    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

bool WaitForHealth(unsigned short port) {
    for (int i = 0; i < 30; ++i) {
        try {
            auto res = SendRequest(http::verb::get, port, "/healthz", "", "");
            if (res.result() == http::status::ok) {
                return true;
            }
        } catch (const std::exception&) {
            // Server may not be ready yet.
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return false;
}

Poco::JSON::Object::Ptr ParseJson(const std::string& body) {
    Poco::JSON::Parser parser;
    return parser.parse(body).extract<Poco::JSON::Object::Ptr>();
}

class IntegrationHttp : public ::testing::Test {
protected:
    void SetUp() override {
        port_ = FindFreePort();
        temp_dir_ = MakeTempDir();
        const auto db_path = temp_dir_ / "metadata.db";
        SeedPrincipal(db_path, "it-user");
        const auto config_path = WriteServerConfig(temp_dir_, port_);
        const auto database_path = WriteDatabaseConfig(temp_dir_, db_path);

        std::vector<std::string> args = {"--config", config_path.string(), "--database",
                                         database_path.string()};
        server_ = std::make_unique<ServerProcess>(
            Poco::Process::launch(CHUNKSHARE_SERVER_PATH, args));
        ASSERT_TRUE(WaitForHealth(port_));
        auth_ = {{"Authorization", BearerFor("it-user")}};
    }

    void TearDown() override {
        server_.reset();
        CleanupTempDir(temp_dir_);
    }

    unsigned short port_{0};
    std::filesystem::path temp_dir_;
    std::unique_ptr<ServerProcess> server_;
    std::vector<std::pair<std::string, std::string>> auth_;
};

}  // namespace

TEST_F(IntegrationHttp, RejectsMissingAndUnknownBearers) {
    auto without_token = SendRequest(http::verb::get, port_, "/v1/files", "", "");
    EXPECT_EQ(without_token.result(), http::status::unauthorized);
    auto envelope = ParseJson(without_token.body());
    ASSERT_TRUE(envelope->getObject("error"));
    EXPECT_EQ(envelope->getObject("error")->getValue<std::string>("code"), "UNAUTHORIZED");

    auto bad_token = SendRequest(http::verb::get, port_, "/v1/files", "", "",
                                 {{"Authorization", "Bearer invalid.token"}});
    EXPECT_EQ(bad_token.result(), http::status::unauthorized);

    auto stranger = SendRequest(http::verb::get, port_, "/v1/files", "", "",
                                {{"Authorization", BearerFor("nobody")}});
    EXPECT_EQ(stranger.result(), http::status::unauthorized);

    auto with_token = SendRequest(http::verb::get, port_, "/v1/files", "", "", auth_);
    EXPECT_EQ(with_token.result(), http::status::ok);
}

TEST_F(IntegrationHttp, ChunkedUploadAndOneTimeDownload) {
    const std::string payload = "abcdefghijkl";
    const std::string digest = "d682ed4ca4d989c134ec94f1551e1ec580dd6d5a6ecde9f3d35e6e4a717fbde4";

    auto create = SendRequest(http::verb::post, port_, "/v1/upload/sessions",
                              R"({"filename":"letters.txt","size":12,"mime_type":"text/plain",)"
                              R"("chunk_size":4,"total_chunks":3,"file_sha256":")" + digest +
                                  "\"}",
                              "application/json", auth_);
    ASSERT_EQ(create.result(), http::status::created);
    auto created = ParseJson(create.body());
    const auto session_id = created->getValue<std::string>("upload_session_id");
    EXPECT_EQ(created->getValue<int>("total_chunks"), 3);

    // Chunks arrive out of order.
    for (int index : {2, 0, 1}) {
        auto headers = auth_;
        headers.emplace_back("X-Chunk-Size", "4");
        auto put = SendRequest(http::verb::put, port_,
                               "/v1/upload/sessions/" + session_id + "/chunks/" +
                                   std::to_string(index),
                               payload.substr(static_cast<std::size_t>(index) * 4, 4),
                               "application/octet-stream", headers);
        ASSERT_EQ(put.result(), http::status::ok) << put.body();
    }

    auto status = SendRequest(http::verb::get, port_, "/v1/upload/sessions/" + session_id, "",
                              "", auth_);
    ASSERT_EQ(status.result(), http::status::ok);
    EXPECT_EQ(ParseJson(status.body())->getArray("missing")->size(), 0u);

    auto finalize = SendRequest(http::verb::post, port_,
                                "/v1/upload/sessions/" + session_id + "/finalize",
                                R"({"file_sha256":")" + digest + "\"}", "application/json",
                                auth_);
    ASSERT_EQ(finalize.result(), http::status::accepted);
    const auto file_id = ParseJson(finalize.body())->getValue<std::string>("file_id");

    std::string file_status;
    for (int i = 0; i < 50 && file_status != "ready"; ++i) {
        auto file = SendRequest(http::verb::get, port_, "/v1/files/" + file_id, "", "", auth_);
        ASSERT_EQ(file.result(), http::status::ok);
        file_status = ParseJson(file.body())->getValue<std::string>("status");
        if (file_status != "ready") {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
    ASSERT_EQ(file_status, "ready");

    auto link = SendRequest(http::verb::post, port_, "/v1/files/" + file_id + "/links",
                            R"({"expires_in_minutes":10})", "application/json", auth_);
    ASSERT_EQ(link.result(), http::status::created);
    const auto url = ParseJson(link.body())->getValue<std::string>("url");

    auto download = SendRequest(http::verb::get, port_, url, "", "");
    ASSERT_EQ(download.result(), http::status::ok);
    EXPECT_EQ(download.body(), payload);
    EXPECT_NE(download[http::field::content_disposition].find("letters.txt"), std::string::npos);

    auto range = SendRequest(http::verb::get, port_, url, "", "", {{"Range", "bytes=4-7"}});
    EXPECT_EQ(range.result(), http::status::partial_content);
    EXPECT_EQ(range.body(), "efgh");

    auto unsatisfiable =
        SendRequest(http::verb::get, port_, url, "", "", {{"Range", "bytes=100-200"}});
    EXPECT_EQ(unsatisfiable.result(), http::status::range_not_satisfiable);

    auto once = SendRequest(http::verb::post, port_, "/v1/files/" + file_id + "/links",
                            R"({"one_time":true})", "application/json", auth_);
    ASSERT_EQ(once.result(), http::status::created);
    const auto once_url = ParseJson(once.body())->getValue<std::string>("url");
    EXPECT_EQ(SendRequest(http::verb::get, port_, once_url, "", "").result(), http::status::ok);
    auto second = SendRequest(http::verb::get, port_, once_url, "", "");
    EXPECT_EQ(second.result(), http::status::gone);
}
