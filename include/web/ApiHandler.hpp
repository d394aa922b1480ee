#pragma once

#include "data/RetainedFileStore.hpp"
#include "media/DownloadOrchestrator.hpp"
#include "media/MetadataFetcher.hpp"
#include "web/HttpServer.hpp"
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Yturl {

class SseStream;

/**
 * REST surface under /api/video
 *
 *   POST /api/video/info          metadata plus selectable formats
 *   GET  /api/video/download      progress as server-sent events
 *   GET  /api/video/file/<id>     the finished artifact, once
 *   GET  /api/video/thumb         image proxy for hosts that block hotlinking
 *
 * Calls that block on the tool or the network run on their own thread so
 * the io_context threads stay free for I/O. Those threads are tracked;
 * shutdown() cancels running downloads and waits for all of them, and must
 * be called while the io_context is still alive.
 */
class ApiHandler : public std::enable_shared_from_this<ApiHandler> {
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using Query = std::map<std::string, std::string>;

    ApiHandler(std::shared_ptr<MetadataFetcher> fetcher,
               std::shared_ptr<DownloadOrchestrator> orchestrator,
               std::shared_ptr<RetainedFileStore> store);

    // Route one request; the response goes back through the session
    void handle(Request&& req, std::shared_ptr<HttpSession> session);

    // Blocking route bodies
    Response videoInfo(const Request& req) const;
    Response thumbnail(const Query& query, unsigned version) const;

    // Split a request target into its path and decoded query parameters
    static void parseTarget(const std::string& target, std::string& path, Query& query);
    static std::string urlDecode(const std::string& text);

    static Response createJsonResponse(http::status status, const nlohmann::json& body, unsigned version = 11);
    static Response createErrorResponse(http::status status, const std::string& message, unsigned version = 11);
    static void addCorsHeaders(http::fields& fields);

    // Refuse new work, cancel download jobs and join every worker
    void shutdown();

    // Workers not yet finished
    size_t activeWorkers();

private:
    struct Worker {
        std::shared_ptr<DownloadJob> job;   // null for info/thumbnail calls
        std::future<void> done;
    };

    std::shared_ptr<MetadataFetcher> fetcher;
    std::shared_ptr<DownloadOrchestrator> orchestrator;
    std::shared_ptr<RetainedFileStore> store;

    std::mutex workersMutex;
    std::vector<Worker> workers;
    bool stopping;

    // False once shutdown() has begun
    bool launch(std::shared_ptr<DownloadJob> job, std::function<void()> task);
    void pruneFinishedWorkers();

    void startDownload(const Request& req, const Query& query, std::shared_ptr<HttpSession> session);
    void streamJob(std::shared_ptr<DownloadJob> job, std::shared_ptr<SseStream> events) const;
    void serveFile(const Request& req, const std::string& fileId, std::shared_ptr<HttpSession> session);
    void respondAsync(const Request& req, std::shared_ptr<HttpSession> session,
                      std::function<Response()> work);

    static void reply(const Request& req, const std::shared_ptr<HttpSession>& session, Response&& res);
};

} // namespace Yturl
