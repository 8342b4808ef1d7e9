/**
 * @file TransferScenarioTest.cpp
 * @brief Сквозной сценарий: x-api-key -> ApiKeyMiddleware -> handler -> TransferService -> диск
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "adapters/primary/ApiKeyMiddleware.hpp"
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/DownloadHandler.hpp"
#include "adapters/primary/UploadHandler.hpp"
#include "adapters/secondary/filesystem/FileSystemPathValidator.hpp"
#include "adapters/secondary/persistence/FileTransferStorage.hpp"
#include "application/Authenticator.hpp"
#include "application/TransferService.hpp"
#include "mocks/InMemoryCredentialStore.hpp"
#include "mocks/InlineExecutor.hpp"
#include "mocks/TempDir.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>

#include <filesystem>

using namespace hostlink;
using namespace hostlink::adapters::primary;
using namespace hostlink::tests;
using json = nlohmann::json;

namespace fs = std::filesystem;

class TransferScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        filesDir_ = fs::canonical(tmp_.sub("files")).string();
        auto storageSettings = std::make_shared<settings::StorageSettings>(
            settings::StorageSettings::forDataDir((tmp_.path() / "state").string()));
        auto transferSettings = std::make_shared<settings::TransferSettings>();
        transferSettings->setAllowedRoots({filesDir_});

        store_ = std::make_shared<InMemoryCredentialStore>();
        auto executor = std::make_shared<InlineExecutor>();
        auto service = std::make_shared<application::TransferService>(
            std::make_shared<adapters::secondary::FileTransferStorage>(storageSettings),
            std::make_shared<adapters::secondary::FileSystemPathValidator>(transferSettings),
            executor,
            transferSettings);

        auto apiKey = std::make_shared<ApiKeyMiddleware>(
            std::make_shared<application::Authenticator>(store_, executor));
        upload_ = std::make_shared<ChainHandler>(apiKey, std::make_shared<UploadHandler>(service, transferSettings));
        download_ = std::make_shared<ChainHandler>(apiKey, std::make_shared<DownloadHandler>(service, transferSettings));

        phoneKey_ = store_->addApproved("phone").apiKey;
        tabletKey_ = store_->addApproved("tablet").apiKey;
    }

    SimpleResponse send(IHttpHandler& handler, const std::string& method, const std::string& path,
                        const std::string& key, const std::string& body = "",
                        std::map<std::string, std::string> headers = {}) {
        if (!key.empty()) {
            headers["x-api-key"] = key;
        }
        SimpleRequest req(method, path, body, "10.0.0.9", 8080, headers);
        auto query = path.find('?');
        if (query != std::string::npos) {
            // как роутер: путь без query, параметры отдельно
            req.setPath(path.substr(0, query));
            auto pair = path.substr(query + 1);
            auto eq = pair.find('=');
            req.setQueryParam(pair.substr(0, eq), pair.substr(eq + 1));
        }
        SimpleResponse res;
        handler.handle(req, res);
        return res;
    }

    static json body(SimpleResponse& res) {
        return json::parse(res.getBody());
    }

    TempDir tmp_;
    std::string filesDir_;
    std::shared_ptr<InMemoryCredentialStore> store_;
    std::shared_ptr<ChainHandler> upload_;
    std::shared_ptr<ChainHandler> download_;
    std::string phoneKey_;
    std::string tabletKey_;
};

TEST_F(TransferScenarioTest, UploadInReverseThenDownloadBack) {
    const std::string content = "The quick brown fox jumps over the lazy dog";
    const std::size_t chunkSize = 8;

    json init{{"file_name", "fox.txt"}, {"destination_path", filesDir_}, {"file_size", content.size()}};
    auto initRes = send(*upload_, "POST", "/upload/initiate", phoneKey_, init.dump());
    ASSERT_EQ(initRes.getStatus(), 200) << initRes.getBody();
    std::string uploadId = body(initRes)["upload_id"];

    std::vector<std::size_t> offsets;
    for (std::size_t offset = 0; offset < content.size(); offset += chunkSize) {
        offsets.push_back(offset);
    }
    for (auto it = offsets.rbegin(); it != offsets.rend(); ++it) {
        auto res = send(*upload_, "POST", "/upload/chunk/" + uploadId + "?offset=" + std::to_string(*it),
                        phoneKey_, content.substr(*it, chunkSize));
        ASSERT_EQ(res.getStatus(), 200) << res.getBody();
    }

    auto statusRes = send(*upload_, "GET", "/upload/status/" + uploadId, phoneKey_);
    EXPECT_EQ(body(statusRes)["bytes_received"], content.size());
    EXPECT_EQ(body(statusRes)["buffered_bytes"], 0);

    auto doneRes = send(*upload_, "POST", "/upload/complete/" + uploadId, phoneKey_);
    ASSERT_EQ(doneRes.getStatus(), 200) << doneRes.getBody();
    std::string finalPath = body(doneRes)["path"];
    EXPECT_EQ(TempDir::readFile(finalPath), content);

    auto dlRes = send(*download_, "POST", "/download/initiate", tabletKey_, json{{"file_path", finalPath}}.dump());
    ASSERT_EQ(dlRes.getStatus(), 200) << dlRes.getBody();
    std::string downloadId = body(dlRes)["download_id"];

    std::string received;
    for (std::size_t offset = 0; offset < content.size(); offset += chunkSize) {
        std::string range = "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + chunkSize - 1);
        auto res = send(*download_, "GET", "/download/chunk/" + downloadId, tabletKey_, "", {{"Range", range}});
        ASSERT_EQ(res.getStatus(), 206);
        received += res.getBody();
    }
    EXPECT_EQ(received, content);
}

TEST_F(TransferScenarioTest, OtherDeviceKey_SeesNotFound) {
    json init{{"file_name", "secret.txt"}, {"destination_path", filesDir_}, {"file_size", 4}};
    auto initRes = send(*upload_, "POST", "/upload/initiate", phoneKey_, init.dump());
    std::string uploadId = body(initRes)["upload_id"];

    auto res = send(*upload_, "GET", "/upload/status/" + uploadId, tabletKey_);
    EXPECT_EQ(res.getStatus(), 404);

    auto list = send(*upload_, "GET", "/upload/list-active", tabletKey_);
    EXPECT_TRUE(body(list)["uploads"].empty());
}

TEST_F(TransferScenarioTest, OtherDeviceKey_CancelAnswersLikeUnknownId) {
    json init{{"file_name", "keep.txt"}, {"destination_path", filesDir_}, {"file_size", 4}};
    auto initRes = send(*upload_, "POST", "/upload/initiate", phoneKey_, init.dump());
    std::string uploadId = body(initRes)["upload_id"];

    auto foreign = send(*upload_, "DELETE", "/upload/cancel/" + uploadId, tabletKey_);
    auto unknown = send(*upload_, "DELETE", "/upload/cancel/00000000-0000-0000-0000-000000000000", tabletKey_);
    EXPECT_EQ(foreign.getStatus(), 200);
    EXPECT_EQ(unknown.getStatus(), 200);
    EXPECT_EQ(body(foreign)["status"], body(unknown)["status"]);

    auto status = send(*upload_, "GET", "/upload/status/" + uploadId, phoneKey_);
    EXPECT_EQ(status.getStatus(), 200);
}

TEST_F(TransferScenarioTest, MasterKey_SeesAndCancelsAnySession) {
    json init{{"file_name", "stuck.bin"}, {"destination_path", filesDir_}, {"file_size", 4}};
    auto initRes = send(*upload_, "POST", "/upload/initiate", phoneKey_, init.dump());
    std::string uploadId = body(initRes)["upload_id"];

    auto list = send(*upload_, "GET", "/upload/list-active", store_->masterKey());
    EXPECT_EQ(body(list)["uploads"].size(), 1u);

    auto cancel = send(*upload_, "DELETE", "/upload/cancel/" + uploadId, store_->masterKey());
    EXPECT_EQ(cancel.getStatus(), 200);

    auto status = send(*upload_, "GET", "/upload/status/" + uploadId, phoneKey_);
    EXPECT_EQ(status.getStatus(), 404);
}

TEST_F(TransferScenarioTest, NoKeyOrRevokedKey_Returns403) {
    auto none = send(*upload_, "GET", "/upload/config", "");
    EXPECT_EQ(none.getStatus(), 403);
    EXPECT_EQ(body(none)["error"], "Invalid API Key");

    store_->revoke("phone");
    auto revoked = send(*download_, "GET", "/download/config", phoneKey_);
    EXPECT_EQ(revoked.getStatus(), 403);
    EXPECT_EQ(revoked.getBody(), none.getBody());
}
