/**
 * @file DownloadHandlerTest.cpp
 * @brief Тесты HTTP-слоя скачивания: Range, 206, 416, заголовки
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "adapters/primary/DownloadHandler.hpp"
#include "adapters/secondary/filesystem/FileSystemPathValidator.hpp"
#include "adapters/secondary/persistence/FileTransferStorage.hpp"
#include "application/TransferService.hpp"
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

class DownloadHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        filesDir_ = fs::canonical(tmp_.sub("files")).string();
        auto storageSettings = std::make_shared<settings::StorageSettings>(
            settings::StorageSettings::forDataDir((tmp_.path() / "state").string()));
        settings_ = std::make_shared<settings::TransferSettings>();
        settings_->setAllowedRoots({filesDir_});

        auto service = std::make_shared<application::TransferService>(
            std::make_shared<adapters::secondary::FileTransferStorage>(storageSettings),
            std::make_shared<adapters::secondary::FileSystemPathValidator>(settings_),
            std::make_shared<InlineExecutor>(),
            settings_);
        handler_ = std::make_shared<DownloadHandler>(service, settings_);

        sourcePath_ = (fs::path(filesDir_) / "alphabet.txt").string();
        TempDir::writeFile(sourcePath_, "abcdefghijklmnopqrstuvwxyz");
    }

    SimpleRequest request(const std::string& method, const std::string& path,
                          const std::string& body = "",
                          std::map<std::string, std::string> headers = {}) {
        SimpleRequest req(method, path, body, "10.0.0.5", 8080, headers);
        req.setAttribute(ATTR_CLIENT_ID, "dev-1");
        req.setAttribute(ATTR_DEVICE_ID, "dev-1");
        req.setAttribute(ATTR_IS_MASTER, "false");
        return req;
    }

    json parseJson(SimpleResponse& res) {
        try {
            return json::parse(res.getBody());
        } catch (const json::exception& e) {
            ADD_FAILURE() << "Failed to parse JSON: " << e.what() << "\nBody: " << res.getBody();
            return json();
        }
    }

    std::string initiate(const std::string& path) {
        auto req = request("POST", "/download/initiate", json{{"file_path", path}}.dump());
        SimpleResponse res;
        handler_->handle(req, res);
        EXPECT_EQ(res.getStatus(), 200) << res.getBody();
        return parseJson(res)["download_id"].get<std::string>();
    }

    SimpleResponse chunk(const std::string& downloadId, const std::string& range) {
        std::map<std::string, std::string> headers;
        if (!range.empty()) {
            headers["Range"] = range;
        }
        auto req = request("GET", "/download/chunk/" + downloadId, "", headers);
        SimpleResponse res;
        handler_->handle(req, res);
        return res;
    }

    TempDir tmp_;
    std::string filesDir_;
    std::string sourcePath_;
    std::shared_ptr<settings::TransferSettings> settings_;
    std::shared_ptr<DownloadHandler> handler_;
};

TEST_F(DownloadHandlerTest, Initiate_ReturnsSizeAndName) {
    auto req = request("POST", "/download/initiate", json{{"file_path", sourcePath_}}.dump());
    SimpleResponse res;
    handler_->handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    auto body = parseJson(res);
    EXPECT_FALSE(body["download_id"].get<std::string>().empty());
    EXPECT_EQ(body["file_size"], 26);
    EXPECT_EQ(body["file_name"], "alphabet.txt");
}

TEST_F(DownloadHandlerTest, Initiate_MissingFile_Returns404) {
    auto req = request("POST", "/download/initiate",
                       json{{"file_path", filesDir_ + "/nope.txt"}}.dump());
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

TEST_F(DownloadHandlerTest, Initiate_Directory_Returns400) {
    auto req = request("POST", "/download/initiate", json{{"file_path", filesDir_}}.dump());
    SimpleResponse res;
    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(DownloadHandlerTest, Chunk_Range_Returns206WithHeaders) {
    auto id = initiate(sourcePath_);

    auto res = chunk(id, "bytes=0-9");

    ASSERT_EQ(res.getStatus(), 206);
    EXPECT_EQ(res.getBody(), "abcdefghij");
    EXPECT_EQ(res.getHeader("Content-Range").value_or(""), "bytes 0-9/26");
    EXPECT_EQ(res.getHeader("Accept-Ranges").value_or(""), "bytes");
    EXPECT_EQ(res.getHeader("Content-Length").value_or(""), "10");
    EXPECT_EQ(res.getHeader("Content-Type").value_or(""), "application/octet-stream");
    EXPECT_NE(res.getHeader("Content-Disposition").value_or("").find("alphabet.txt"), std::string::npos);
}

TEST_F(DownloadHandlerTest, Chunk_OpenEndedRange_ReturnsTail) {
    auto id = initiate(sourcePath_);

    auto res = chunk(id, "bytes=20-");

    ASSERT_EQ(res.getStatus(), 206);
    EXPECT_EQ(res.getBody(), "uvwxyz");
    EXPECT_EQ(res.getHeader("Content-Range").value_or(""), "bytes 20-25/26");
}

TEST_F(DownloadHandlerTest, Chunk_NoRange_WholeFile) {
    auto id = initiate(sourcePath_);

    auto res = chunk(id, "");

    ASSERT_EQ(res.getStatus(), 206);
    EXPECT_EQ(res.getBody(), "abcdefghijklmnopqrstuvwxyz");
}

TEST_F(DownloadHandlerTest, Chunk_RangeLongerThanChunkSize_ShortenedSlice) {
    settings_->setDownloadChunkSize(8);
    auto id = initiate(sourcePath_);

    auto res = chunk(id, "bytes=2-25");

    ASSERT_EQ(res.getStatus(), 206);
    EXPECT_EQ(res.getBody(), "cdefghij");
    EXPECT_EQ(res.getHeader("Content-Range").value_or(""), "bytes 2-9/26");
    EXPECT_EQ(res.getHeader("Content-Length").value_or(""), "8");

    auto whole = chunk(id, "");
    EXPECT_EQ(whole.getBody(), "abcdefgh");
    EXPECT_EQ(whole.getHeader("Content-Range").value_or(""), "bytes 0-7/26");
}

TEST_F(DownloadHandlerTest, Chunk_RangeBeyondEnd_Returns416) {
    auto id = initiate(sourcePath_);

    auto res = chunk(id, "bytes=26-30");

    EXPECT_EQ(res.getStatus(), 416);
}

TEST_F(DownloadHandlerTest, Chunk_MalformedRange_Returns400) {
    auto id = initiate(sourcePath_);

    auto res = chunk(id, "lines=1-2");

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(DownloadHandlerTest, Chunk_EmptyFile_Returns200) {
    auto empty = (fs::path(filesDir_) / "empty.bin").string();
    TempDir::writeFile(empty, "");
    auto id = initiate(empty);

    auto res = chunk(id, "");

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_TRUE(res.getBody().empty());
    EXPECT_FALSE(res.getHeader("Content-Range").has_value());
}

TEST_F(DownloadHandlerTest, Chunk_SourceChanged_Returns409) {
    auto id = initiate(sourcePath_);
    TempDir::writeFile(sourcePath_, "different length");

    auto res = chunk(id, "bytes=0-3");

    EXPECT_EQ(res.getStatus(), 409);
}

TEST_F(DownloadHandlerTest, Status_ReportsProgress) {
    auto id = initiate(sourcePath_);
    chunk(id, "bytes=0-12");

    auto req = request("GET", "/download/status/" + id);
    SimpleResponse res;
    handler_->handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    auto body = parseJson(res);
    EXPECT_EQ(body["bytes_downloaded"], 13);
    EXPECT_DOUBLE_EQ(body["progress_percent"].get<double>(), 50.0);
    EXPECT_EQ(body["status"], "active");
}

TEST_F(DownloadHandlerTest, PauseResumeCancel_Lifecycle) {
    auto id = initiate(sourcePath_);

    auto pause = request("POST", "/download/pause/" + id);
    SimpleResponse pauseRes;
    handler_->handle(pause, pauseRes);
    EXPECT_EQ(parseJson(pauseRes)["status"], "paused");

    auto resume = request("POST", "/download/resume/" + id);
    SimpleResponse resumeRes;
    handler_->handle(resume, resumeRes);
    EXPECT_EQ(parseJson(resumeRes)["status"], "active");
    EXPECT_EQ(parseJson(resumeRes)["resume_offset"], 0);

    auto cancel = request("DELETE", "/download/cancel/" + id);
    SimpleResponse cancelRes;
    handler_->handle(cancel, cancelRes);
    EXPECT_EQ(parseJson(cancelRes)["status"], "cancelled");

    EXPECT_EQ(chunk(id, "bytes=0-1").getStatus(), 404);
}

TEST_F(DownloadHandlerTest, ListActive_ReturnsDownloads) {
    initiate(sourcePath_);
    initiate(sourcePath_);

    auto req = request("GET", "/download/list-active");
    SimpleResponse res;
    handler_->handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parseJson(res)["downloads"].size(), 2u);
}

TEST_F(DownloadHandlerTest, Config_AdvertisesRangeSupport) {
    auto req = request("GET", "/download/config");
    SimpleResponse res;
    handler_->handle(req, res);

    ASSERT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parseJson(res)["supports_range"], true);
    EXPECT_EQ(parseJson(res)["recommended_chunk_size"], settings_->getDownloadChunkSize());
}

TEST(DownloadHandlerStaticTest, ContentDisposition_EncodesNonAscii) {
    auto header = DownloadHandler::contentDisposition("отчёт 2024.pdf");

    EXPECT_EQ(header.rfind("attachment; filename=\"", 0), 0u);
    EXPECT_NE(header.find("filename*=UTF-8''%D0%BE"), std::string::npos);
    EXPECT_NE(header.find("%202024.pdf"), std::string::npos);
}

TEST(DownloadHandlerStaticTest, ContentDisposition_EscapesQuotes) {
    auto header = DownloadHandler::contentDisposition("a\"b.txt");

    EXPECT_EQ(header, "attachment; filename=\"a_b.txt\"; filename*=UTF-8''a%22b.txt");
}
