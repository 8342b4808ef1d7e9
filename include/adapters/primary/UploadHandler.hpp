#pragma once

#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/ITransferService.hpp"
#include "settings/TransferSettings.hpp"

#include <IHttpHandler.hpp>
#include <iostream>
#include <memory>
#include <regex>

namespace hostlink::adapters::primary {

/**
 * @brief HTTP Handler загрузки файлов на хост
 *
 * Endpoints:
 * - GET    /upload/config
 * - POST   /upload/check-conflict {destination_path, file_name}
 * - POST   /upload/initiate {file_name, destination_path, file_size?, conflict_resolution}
 * - POST   /upload/chunk/{id}?offset=N   (тело - сырые байты)
 * - POST   /upload/stream/{id}           (тело дописывается с текущего смещения)
 * - POST   /upload/direct?destination_path=...&file_name=...&conflict_resolution=keep_both&file_size=N
 * - POST   /upload/complete/{id}
 * - POST   /upload/pause/{id}
 * - POST   /upload/resume/{id}
 * - DELETE /upload/cancel/{id}
 * - GET    /upload/status/{id}
 * - GET    /upload/list-active
 */
class UploadHandler : public IHttpHandler {
public:
    UploadHandler(std::shared_ptr<ports::input::ITransferService> transferService,
                  std::shared_ptr<settings::TransferSettings> settings)
        : transferService_(std::move(transferService))
        , settings_(std::move(settings))
    {
        std::cout << "[UploadHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        static const std::regex sessionRegex(R"(^/upload/(chunk|stream|complete|pause|resume|cancel|status)/([^/]+)$)");

        try {
            const std::string method = req.getMethod();
            const std::string path = req.getPath();
            std::smatch matches;

            if (method == "GET" && path == "/upload/config") {
                handleConfig(res);
            } else if (method == "POST" && path == "/upload/check-conflict") {
                handleCheckConflict(req, res);
            } else if (method == "POST" && path == "/upload/initiate") {
                handleInitiate(req, res);
            } else if (method == "POST" && path == "/upload/direct") {
                handleDirect(req, res);
            } else if (method == "GET" && path == "/upload/list-active") {
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
            std::cerr << "[UploadHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

    static nlohmann::json snapshotToJson(const ports::input::TransferSnapshot& snapshot)
    {
        const auto& session = snapshot.session;
        const auto& upload = session.upload();

        nlohmann::json j;
        j["upload_id"] = session.transferId;
        j["file_name"] = session.fileName;
        j["bytes_received"] = session.bytesTransferred;
        j["expected_size"] = upload.expectedSize ? nlohmann::json(*upload.expectedSize) : nlohmann::json(nullptr);
        j["buffered_bytes"] = snapshot.bufferedBytes;
        j["status"] = domain::toString(session.status);
        j["resumable"] = domain::isOpenStatus(session.status);
        j["created_at"] = session.createdAt.toString();
        return j;
    }

private:
    std::shared_ptr<ports::input::ITransferService> transferService_;
    std::shared_ptr<settings::TransferSettings> settings_;

    void dispatchSession(IRequest& req, IResponse& res, const std::string& method,
                         const std::string& action, const std::string& uploadId)
    {
        auto caller = callerIdentity(req);

        if (method == "POST" && action == "chunk") {
            handleChunk(req, res, caller, uploadId);
        } else if (method == "POST" && action == "stream") {
            auto result = transferService_->streamUpload(caller, uploadId, req.getBody());
            nlohmann::json response;
            response["status"] = "stream received";
            response["bytes_written"] = result.bytesWritten;
            response["next_offset"] = result.nextExpectedOffset;
            sendJson(res, 200, response);
        } else if (method == "POST" && action == "complete") {
            std::string finalPath = transferService_->completeUpload(caller, uploadId);
            sendJson(res, 200, {{"status", "completed"}, {"path", finalPath}});
        } else if (method == "POST" && action == "pause") {
            auto snapshot = transferService_->pauseUpload(caller, uploadId);
            sendJson(res, 200, snapshotToJson(snapshot));
        } else if (method == "POST" && action == "resume") {
            auto snapshot = transferService_->resumeUpload(caller, uploadId);
            auto response = snapshotToJson(snapshot);
            response["resume_offset"] = snapshot.session.bytesTransferred;
            sendJson(res, 200, response);
        } else if (method == "DELETE" && action == "cancel") {
            transferService_->cancelUpload(caller, uploadId);
            sendJson(res, 200, {{"status", "cancelled"}, {"upload_id", uploadId}});
        } else if (method == "GET" && action == "status") {
            auto snapshot = transferService_->status(caller, domain::TransferKind::UPLOAD, uploadId);
            sendJson(res, 200, snapshotToJson(snapshot));
        } else {
            sendError(res, 405, "Method not allowed");
        }
    }

    void handleConfig(IResponse& res)
    {
        nlohmann::json response;
        response["recommended_chunk_size"] = settings_->getUploadChunkSize();
        response["max_buffered_bytes"] = settings_->getMaxBufferedBytes();
        response["supports_concurrent_chunks"] = true;
        response["supports_resume"] = true;
        response["supports_pause"] = true;
        sendJson(res, 200, response);
    }

    void handleCheckConflict(IRequest& req, IResponse& res)
    {
        auto body = parseObject(req);
        auto result = transferService_->checkConflict(requireString(body, "destination_path"),
                                                      requireString(body, "file_name"));
        nlohmann::json response;
        response["conflict"] = result.conflict;
        if (result.conflict) {
            response["existing_file"] = result.existingFile;
            response["suggested_name"] = result.suggestedName;
            response["options"] = {"abort", "overwrite", "keep_both"};
        }
        sendJson(res, 200, response);
    }

    void handleInitiate(IRequest& req, IResponse& res)
    {
        auto body = parseObject(req);

        ports::input::UploadRequest request;
        request.fileName = requireString(body, "file_name");
        request.destinationPath = requireString(body, "destination_path");
        if (body.contains("file_size") && !body["file_size"].is_null()) {
            if (!body["file_size"].is_number_unsigned()) {
                throw domain::ValidationError("file_size must be a non-negative integer");
            }
            request.fileSize = body["file_size"].get<std::uint64_t>();
        }
        request.conflictPolicy = parsePolicy(body.value("conflict_resolution", "abort"));

        auto result = transferService_->initiateUpload(callerIdentity(req), request);

        nlohmann::json response;
        response["upload_id"] = result.uploadId;
        response["final_file_name"] = result.finalFileName;
        response["resumed"] = result.resumed;
        sendJson(res, 200, response);
    }

    static domain::ConflictPolicy parsePolicy(const std::string& text)
    {
        try {
            return domain::conflictPolicyFromString(text);
        } catch (const std::invalid_argument&) {
            throw domain::ValidationError("conflict_resolution must be abort, overwrite or keep_both");
        }
    }

    /// Параметры в query, тело - содержимое файла. По умолчанию keep_both
    void handleDirect(IRequest& req, IResponse& res)
    {
        ports::input::UploadRequest request;
        request.destinationPath = req.getQueryParam("destination_path").value_or("");
        request.fileName = req.getQueryParam("file_name").value_or("");
        if (request.destinationPath.empty()) {
            throw domain::ValidationError("destination_path is required");
        }
        if (request.fileName.empty()) {
            throw domain::ValidationError("file_name is required");
        }
        request.conflictPolicy = parsePolicy(req.getQueryParam("conflict_resolution").value_or("keep_both"));

        std::string sizeText = req.getQueryParam("file_size").value_or("");
        if (!sizeText.empty()) {
            if (sizeText.find_first_not_of("0123456789") != std::string::npos) {
                throw domain::ValidationError("file_size must be a non-negative integer");
            }
            try {
                request.fileSize = std::stoull(sizeText);
            } catch (const std::out_of_range&) {
                throw domain::ValidationError("file_size is out of range");
            }
        }

        auto result = transferService_->directUpload(callerIdentity(req), request, req.getBody());

        nlohmann::json response;
        response["status"] = "completed";
        response["path"] = result.finalPath;
        response["file_name"] = result.fileName;
        response["bytes_written"] = result.bytesWritten;
        sendJson(res, 200, response);
    }

    void handleChunk(IRequest& req, IResponse& res, const domain::ClientIdentity& caller,
                     const std::string& uploadId)
    {
        std::string offsetText = req.getQueryParam("offset").value_or("");
        if (offsetText.empty() || offsetText.find_first_not_of("0123456789") != std::string::npos) {
            throw domain::ValidationError("offset query parameter is required");
        }
        std::uint64_t offset = 0;
        try {
            offset = std::stoull(offsetText);
        } catch (const std::out_of_range&) {
            throw domain::ValidationError("offset is out of range");
        }

        auto result = transferService_->writeChunk(caller, uploadId, offset, req.getBody());

        nlohmann::json response;
        response["status"] = result.accepted ? "received" : "ignored";
        response["bytes_written"] = result.bytesWritten;
        response["next_offset"] = result.nextExpectedOffset;
        sendJson(res, 200, response);
    }

    void handleListActive(IRequest& req, IResponse& res)
    {
        nlohmann::json uploads = nlohmann::json::array();
        for (const auto& snapshot : transferService_->listActive(callerIdentity(req), domain::TransferKind::UPLOAD)) {
            uploads.push_back(snapshotToJson(snapshot));
        }
        sendJson(res, 200, {{"uploads", uploads}});
    }
};

} // namespace hostlink::adapters::primary
