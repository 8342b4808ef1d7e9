#pragma once

#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/ITransferService.hpp"
#include "settings/TransferSettings.hpp"

#include <IHttpHandler.hpp>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <memory>
#include <regex>

namespace hostlink::adapters::primary {

/**
 * @brief HTTP Handler скачивания файлов с хоста
 *
 * Endpoints:
 * - GET    /download/config
 * - POST   /download/initiate {file_path}
 * - GET    /download/chunk/{id}   (Range: bytes=s-e) -> 206
 * - POST   /download/pause/{id}
 * - POST   /download/resume/{id}
 * - DELETE /download/cancel/{id}
 * - GET    /download/status/{id}
 * - GET    /download/list-active
 */
class DownloadHandler : public IHttpHandler {
public:
    DownloadHandler(std::shared_ptr<ports::input::ITransferService> transferService,
                    std::shared_ptr<settings::TransferSettings> settings)
        : transferService_(std::move(transferService))
        , settings_(std::move(settings))
    {
        std::cout << "[DownloadHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        static const std::regex sessionRegex(R"(^/download/(chunk|pause|resume|cancel|status)/([^/]+)$)");

        try {
            const std::string method = req.getMethod();
            const std::string path = req.getPath();
            std::smatch matches;

            if (method == "GET" && path == "/download/config") {
                handleConfig(res);
            } else if (method == "POST" && path == "/download/initiate") {
                handleInitiate(req, res);
            } else if (method == "GET" && path == "/download/list-active") {
                handleListActive(req, res);
            } else if (std::regex_match(path, matches, sessionRegex)) {
                dispatchSession(req, res, method, matches[1].str(), matches[2].str());
            } else {
                sendError(res, 404, "Not found");
            }
        } catch (const domain::HostLinkError& e) {
            sendError(res, e);
        } catch (const nlohmann::json::exception&) {
            sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[DownloadHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

    static nlohmann::json snapshotToJson(const ports::input::TransferSnapshot& snapshot)
    {
        const auto& session = snapshot.session;
        const auto fileSize = session.download().fileSize;
        double progress = fileSize > 0
            ? static_cast<double>(session.bytesTransferred) * 100.0 / static_cast<double>(fileSize)
            : 100.0;

        nlohmann::json j;
        j["download_id"] = session.transferId;
        j["file_name"] = session.fileName;
        j["file_size"] = fileSize;
        j["bytes_downloaded"] = session.bytesTransferred;
        j["progress_percent"] = static_cast<double>(static_cast<long long>(progress * 100.0)) / 100.0;
        j["status"] = domain::toString(session.status);
        j["created_at"] = session.createdAt.toString();
        return j;
    }

    /**
     * @brief Content-Disposition с ASCII-именем и filename* по RFC 5987
     */
    static std::string contentDisposition(const std::string& fileName)
    {
        std::string fallback;
        std::string encoded;
        for (unsigned char c : fileName) {
            fallback += (c >= 0x20 && c < 0x7f && c != '"' && c != '\\') ? static_cast<char>(c) : '_';

            bool unreserved = std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
            if (unreserved) {
                encoded += static_cast<char>(c);
            } else {
                char buf[4];
                std::snprintf(buf, sizeof(buf), "%%%02X", c);
                encoded += buf;
            }
        }
        return "attachment; filename=\"" + fallback + "\"; filename*=UTF-8''" + encoded;
    }

private:
    std::shared_ptr<ports::input::ITransferService> transferService_;
    std::shared_ptr<settings::TransferSettings> settings_;

    void dispatchSession(IRequest& req, IResponse& res, const std::string& method,
                         const std::string& action, const std::string& downloadId)
    {
        auto caller = callerIdentity(req);

        if (method == "GET" && action == "chunk") {
            handleChunk(req, res, caller, downloadId);
        } else if (method == "POST" && action == "pause") {
            sendJson(res, 200, snapshotToJson(transferService_->pauseDownload(caller, downloadId)));
        } else if (method == "POST" && action == "resume") {
            auto snapshot = transferService_->resumeDownload(caller, downloadId);
            auto response = snapshotToJson(snapshot);
            response["resume_offset"] = snapshot.session.bytesTransferred;
            sendJson(res, 200, response);
        } else if (method == "DELETE" && action == "cancel") {
            transferService_->cancelDownload(caller, downloadId);
            sendJson(res, 200, {{"status", "cancelled"}, {"download_id", downloadId}});
        } else if (method == "GET" && action == "status") {
            auto snapshot = transferService_->status(caller, domain::TransferKind::DOWNLOAD, downloadId);
            sendJson(res, 200, snapshotToJson(snapshot));
        } else {
            sendError(res, 405, "Method not allowed");
        }
    }

    void handleConfig(IResponse& res)
    {
        nlohmann::json response;
        response["recommended_chunk_size"] = settings_->getDownloadChunkSize();
        response["supports_range"] = true;
        response["supports_resume"] = true;
        response["supports_pause"] = true;
        sendJson(res, 200, response);
    }

    void handleInitiate(IRequest& req, IResponse& res)
    {
        auto body = parseObject(req);
        auto result = transferService_->initiateDownload(callerIdentity(req), requireString(body, "file_path"));

        nlohmann::json response;
        response["download_id"] = result.downloadId;
        response["file_size"] = result.fileSize;
        response["file_name"] = result.fileName;
        sendJson(res, 200, response);
    }

    void handleChunk(IRequest& req, IResponse& res, const domain::ClientIdentity& caller,
                     const std::string& downloadId)
    {
        auto chunk = transferService_->readChunk(caller, downloadId, req.getHeader("Range"));

        res.setHeader("Content-Type", "application/octet-stream");
        res.setHeader("Accept-Ranges", "bytes");
        res.setHeader("Content-Disposition", contentDisposition(chunk.fileName));
        res.setHeader("Content-Length", std::to_string(chunk.data.size()));
        if (chunk.fileSize == 0) {
            res.setStatus(200);
        } else {
            res.setHeader("Content-Range", chunk.range.contentRange(chunk.fileSize));
            res.setStatus(206);
        }
        res.setBody(std::move(chunk.data));
    }

    void handleListActive(IRequest& req, IResponse& res)
    {
        nlohmann::json downloads = nlohmann::json::array();
        for (const auto& snapshot : transferService_->listActive(callerIdentity(req), domain::TransferKind::DOWNLOAD)) {
            downloads.push_back(snapshotToJson(snapshot));
        }
        sendJson(res, 200, {{"downloads", downloads}});
    }
};

} // namespace hostlink::adapters::primary
