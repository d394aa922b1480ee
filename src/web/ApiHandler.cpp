#include "web/ApiHandler.hpp"
#include "web/SseStream.hpp"
#include "media/FormatSelector.hpp"
#include "utils/FileId.hpp"
#include "utils/Logger.hpp"
#include "utils/PlatformDetector.hpp"
#include <cpr/cpr.h>
#include <algorithm>
#include <chrono>

namespace Yturl {

namespace {

const std::string ApiPrefix = "/api/video";
const std::string FilePrefix = ApiPrefix + "/file/";

std::string toString(beast::string_view view) {
    return std::string(view.data(), view.size());
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string queryValue(const ApiHandler::Query& query, const std::string& key) {
    auto it = query.find(key);
    return it != query.end() ? it->second : "";
}

} // namespace

ApiHandler::ApiHandler(std::shared_ptr<MetadataFetcher> fetcher,
                       std::shared_ptr<DownloadOrchestrator> orchestrator,
                       std::shared_ptr<RetainedFileStore> store)
    : fetcher(std::move(fetcher))
    , orchestrator(std::move(orchestrator))
    , store(std::move(store))
    , stopping(false) {
}

void ApiHandler::handle(Request&& req, std::shared_ptr<HttpSession> session) {
    std::string path;
    Query query;
    parseTarget(toString(req.target()), path, query);
    LOG_WEB_INFO("{} {}", toString(req.method_string()), path);

    try {
        if (req.method() == http::verb::options) {
            Response res{http::status::no_content, req.version()};
            reply(req, session, std::move(res));
            return;
        }

        if (req.method() == http::verb::post && path == ApiPrefix + "/info") {
            auto self = shared_from_this();
            respondAsync(req, session, [self, req] { return self->videoInfo(req); });
            return;
        }

        if (req.method() == http::verb::get && path == ApiPrefix + "/download") {
            startDownload(req, query, session);
            return;
        }

        if (req.method() == http::verb::get && path.compare(0, FilePrefix.size(), FilePrefix) == 0) {
            serveFile(req, path.substr(FilePrefix.size()), session);
            return;
        }

        if (req.method() == http::verb::get && path == ApiPrefix + "/thumb") {
            auto self = shared_from_this();
            unsigned version = req.version();
            respondAsync(req, session, [self, query, version] { return self->thumbnail(query, version); });
            return;
        }

        reply(req, session, createErrorResponse(http::status::not_found, "Not found", req.version()));
    } catch (const std::exception& e) {
        LOG_WEB_ERROR("{} {} failed: {}", toString(req.method_string()), path, e.what());
        reply(req, session, createErrorResponse(http::status::internal_server_error,
                                                "Internal server error", req.version()));
    }
}

ApiHandler::Response ApiHandler::videoInfo(const Request& req) const {
    const unsigned version = req.version();

    nlohmann::json body = nlohmann::json::parse(req.body(), nullptr, false);
    if (body.is_discarded() || !body.is_object()
        || !body.contains("url") || !body["url"].is_string()
        || body["url"].get<std::string>().empty()) {
        return createErrorResponse(http::status::bad_request, "URL is required", version);
    }

    std::string modeText;
    if (body.contains("mode") && body["mode"].is_string()) {
        modeText = body["mode"].get<std::string>();
    }
    auto mode = parseMode(modeText);
    if (!mode) {
        return createErrorResponse(http::status::bad_request, "mode must be video or audio", version);
    }

    MediaReference ref = PlatformDetector::detect(body["url"].get<std::string>());
    if (ref.platform == Platform::Unknown) {
        return createErrorResponse(http::status::bad_request, "Unsupported platform", version);
    }

    MetadataResult info = fetcher->fetch(ref.url);
    if (!info.success) {
        LOG_WEB_WARN("Metadata for {} failed: {}", ref.url, info.error);
        return createErrorResponse(http::status::internal_server_error,
                                   "Failed to get video info: " + info.error, version);
    }

    auto choices = FormatSelector::choicesFor(*mode, info.metadata.formats);
    if (choices.empty()) {
        return createErrorResponse(http::status::unprocessable_entity, "No suitable format found", version);
    }

    // Instagram's CDN refuses cross-origin image loads
    std::string thumbnailUrl = info.metadata.thumbnailUrl;
    if (ref.platform == Platform::Instagram && !thumbnailUrl.empty()) {
        thumbnailUrl = ApiPrefix + "/thumb?url=" + base64UrlEncode(thumbnailUrl);
    }

    nlohmann::json formats = nlohmann::json::array();
    for (const auto& choice : choices) {
        formats.push_back(choice.toJson());
    }

    nlohmann::json response = {
        {"id", info.metadata.id},
        {"title", info.metadata.title},
        {"author", info.metadata.uploaderName},
        {"duration", formatDuration(info.metadata.durationSeconds)},
        {"thumbnail", thumbnailUrl},
        {"platform", platformToString(ref.platform)},
        {"formats", formats}
    };
    LOG_WEB_INFO("Info for {}: {} {} formats", ref.url, choices.size(), modeToString(*mode));
    return createJsonResponse(http::status::ok, response, version);
}

ApiHandler::Response ApiHandler::thumbnail(const Query& query, unsigned version) const {
    std::string encoded = queryValue(query, "url");
    if (encoded.empty()) {
        return createErrorResponse(http::status::bad_request, "url required", version);
    }

    std::string imageUrl;
    if (!base64UrlDecode(encoded, imageUrl) || imageUrl.empty()) {
        return createErrorResponse(http::status::bad_request, "invalid url", version);
    }

    cpr::Response upstream = cpr::Get(cpr::Url{imageUrl}, cpr::Timeout{10000});
    if (upstream.error.code != cpr::ErrorCode::OK || upstream.status_code == 0) {
        LOG_WEB_WARN("Thumbnail fetch from {} failed: {}", imageUrl, upstream.error.message);
        return createErrorResponse(http::status::bad_gateway, "failed to fetch thumbnail", version);
    }

    Response res{static_cast<http::status>(upstream.status_code), version};
    auto contentType = upstream.header.find("Content-Type");
    if (contentType != upstream.header.end()) {
        res.set(http::field::content_type, contentType->second);
    }
    res.set(http::field::cache_control, "public, max-age=3600");
    res.body() = std::move(upstream.text);
    res.prepare_payload();
    return res;
}

void ApiHandler::startDownload(const Request& req, const Query& query, std::shared_ptr<HttpSession> session) {
    std::string url = queryValue(query, "url");
    std::string formatId = queryValue(query, "format");
    if (url.empty() || formatId.empty()) {
        reply(req, session, createErrorResponse(http::status::bad_request, "url and format required", req.version()));
        return;
    }

    auto mode = parseMode(queryValue(query, "mode"));
    if (!mode) {
        reply(req, session, createErrorResponse(http::status::bad_request, "mode must be video or audio", req.version()));
        return;
    }

    MediaReference ref = PlatformDetector::detect(url);
    if (ref.platform == Platform::Unknown) {
        reply(req, session, createErrorResponse(http::status::bad_request, "Unsupported platform", req.version()));
        return;
    }

    DownloadRequest request;
    request.mode = *mode;
    request.formatId = formatId;
    request.url = ref.url;

    std::shared_ptr<DownloadJob> job = orchestrator->start(request);

    auto header = SseStream::makeHeader(req.version());
    addCorsHeaders(header);
    auto events = std::make_shared<SseStream>(session->releaseStream(), std::move(header));

    auto self = shared_from_this();
    if (!launch(job, [self, job, events] { self->streamJob(job, events); })) {
        events->start(nullptr);
        events->push(ProgressEvent::error("Server is shutting down"));
        events->close();
        return;
    }
    events->start([job] { job->cancel(); });

    LOG_WEB_INFO("Streaming job {} for {}", job->getFileId(), ref.url);
}

void ApiHandler::streamJob(std::shared_ptr<DownloadJob> job, std::shared_ptr<SseStream> events) const {
    try {
        auto terminal = orchestrator->run(*job, [this, &events](const ProgressEvent& event) {
            // Tracked before the client can learn the id
            if (event.stage == ProgressStage::Done) {
                store->retain(event.fileId, event.ext);
            }
            events->push(event);
        });

        if (!terminal) {
            LOG_WEB_INFO("Job {} cancelled by client", job->getFileId());
        } else if (terminal->stage == ProgressStage::Error) {
            LOG_WEB_WARN("Job {} failed: {}", job->getFileId(), terminal->errorMessage);
        }
    } catch (const std::exception& e) {
        LOG_WEB_ERROR("Job {} aborted: {}", job->getFileId(), e.what());
        events->push(ProgressEvent::error("Download failed"));
    }
    events->close();
}

void ApiHandler::serveFile(const Request& req, const std::string& fileId, std::shared_ptr<HttpSession> session) {
    if (!FileId::isValid(fileId)) {
        reply(req, session, createErrorResponse(http::status::bad_request, "Invalid file ID", req.version()));
        return;
    }

    auto file = store->open(fileId);
    http::file_body::value_type body;
    beast::error_code ec;
    if (file) {
        body.open(file->path.c_str(), beast::file_mode::scan, ec);
    }
    if (!file || ec) {
        reply(req, session, createErrorResponse(http::status::not_found, "File not found or expired", req.version()));
        return;
    }

    const auto size = body.size();
    http::response<http::file_body> res{
        std::piecewise_construct,
        std::make_tuple(std::move(body)),
        std::make_tuple(http::status::ok, req.version())};
    res.set(http::field::content_type, file->ext == "mp3" ? "audio/mpeg" : "video/mp4");
    res.set(http::field::content_disposition,
            "attachment; filename=\"" + file->fileId + "." + file->ext + "\"");
    addCorsHeaders(res);
    res.content_length(size);
    res.keep_alive(req.keep_alive());

    LOG_WEB_INFO("Serving {} ({} bytes)", file->path, size);
    auto retained = *file;
    auto fileStore = store;
    session->sendFile(std::move(res), [fileStore, retained] { fileStore->release(retained); });
}

void ApiHandler::respondAsync(const Request& req, std::shared_ptr<HttpSession> session,
                              std::function<Response()> work) {
    Request head;
    head.version(req.version());
    head.keep_alive(req.keep_alive());
    head.method(req.method());
    head.target(req.target());

    bool started = launch(nullptr, [head, session, work = std::move(work)] {
        Response res;
        try {
            res = work();
        } catch (const std::exception& e) {
            LOG_WEB_ERROR("{} {} failed: {}", toString(head.method_string()), toString(head.target()), e.what());
            res = createErrorResponse(http::status::internal_server_error, "Internal server error", head.version());
        }
        reply(head, session, std::move(res));
    });
    if (!started) {
        reply(head, session, createErrorResponse(http::status::service_unavailable,
                                                 "Server is shutting down", head.version()));
    }
}

bool ApiHandler::launch(std::shared_ptr<DownloadJob> job, std::function<void()> task) {
    std::lock_guard<std::mutex> lock(workersMutex);
    if (stopping) {
        return false;
    }
    pruneFinishedWorkers();

    Worker worker;
    worker.job = std::move(job);
    worker.done = std::async(std::launch::async, std::move(task));
    workers.push_back(std::move(worker));
    return true;
}

void ApiHandler::pruneFinishedWorkers() {
    workers.erase(std::remove_if(workers.begin(), workers.end(), [](Worker& worker) {
        return !worker.done.valid()
            || worker.done.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }), workers.end());
}

size_t ApiHandler::activeWorkers() {
    std::lock_guard<std::mutex> lock(workersMutex);
    pruneFinishedWorkers();
    return workers.size();
}

void ApiHandler::shutdown() {
    std::vector<Worker> pending;
    {
        std::lock_guard<std::mutex> lock(workersMutex);
        stopping = true;
        pending.swap(workers);
    }

    if (!pending.empty()) {
        LOG_WEB_INFO("Stopping {} API workers", pending.size());
    }
    for (auto& worker : pending) {
        if (worker.job) {
            worker.job->cancel();
        }
    }
    for (auto& worker : pending) {
        if (worker.done.valid()) {
            worker.done.wait();
        }
    }
}

void ApiHandler::reply(const Request& req, const std::shared_ptr<HttpSession>& session, Response&& res) {
    addCorsHeaders(res);
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    session->sendResponse(std::move(res));
}

void ApiHandler::parseTarget(const std::string& target, std::string& path, Query& query) {
    query.clear();
    size_t mark = target.find('?');
    path = target.substr(0, mark);
    if (mark == std::string::npos) {
        return;
    }

    std::string rest = target.substr(mark + 1);
    size_t start = 0;
    while (start <= rest.size()) {
        size_t end = rest.find('&', start);
        if (end == std::string::npos) {
            end = rest.size();
        }
        std::string pair = rest.substr(start, end - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = urlDecode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : urlDecode(pair.substr(eq + 1));
            // First occurrence wins
            query.emplace(key, value);
        }
        start = end + 1;
    }
}

std::string ApiHandler::urlDecode(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            result += ' ';
        } else if (c == '%' && i + 2 < text.size() && hexValue(text[i + 1]) >= 0 && hexValue(text[i + 2]) >= 0) {
            result += static_cast<char>(hexValue(text[i + 1]) * 16 + hexValue(text[i + 2]));
            i += 2;
        } else {
            result += c;
        }
    }
    return result;
}

ApiHandler::Response ApiHandler::createJsonResponse(http::status status, const nlohmann::json& body,
                                                    unsigned version) {
    Response res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

ApiHandler::Response ApiHandler::createErrorResponse(http::status status, const std::string& message,
                                                     unsigned version) {
    nlohmann::json error = {
        {"error", message}
    };
    return createJsonResponse(status, error, version);
}

void ApiHandler::addCorsHeaders(http::fields& fields) {
    fields.set(http::field::access_control_allow_origin, "*");
    fields.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    fields.set(http::field::access_control_allow_headers, "Origin, Content-Type, Accept");
    fields.set(http::field::access_control_expose_headers, "Content-Disposition, Content-Length");
}

} // namespace Yturl
