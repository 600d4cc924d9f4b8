#include "span_extraction_client.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <format>
#include <iostream>

namespace slopgraph {
namespace ml {

using json = nlohmann::json;

// curl write callback
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

struct HttpResponse {
    CURLcode curl_code = CURLE_OK;
    long status = 0;
    std::string body;
};

class SpanExtractionClient::Impl {
public:
    ExtractionServiceConfig config_;

    explicit Impl(const ExtractionServiceConfig& config) : config_(config) {
        curl_global_init(CURL_GLOBAL_ALL);
    }

    ~Impl() {
        curl_global_cleanup();
    }

    HttpResponse post(const std::string& path, const std::string& body) const {
        return perform(path, &body);
    }

    HttpResponse get(const std::string& path) const {
        return perform(path, nullptr);
    }

private:
    HttpResponse perform(const std::string& path, const std::string* body) const {
        HttpResponse response;
        std::string url = config_.endpoint + path;

        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) {
            response.curl_code = CURLE_FAILED_INIT;
            return response;
        }

        curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(headers, &curl_slist_free_all);

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

        if (body) {
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
        } else {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        }

        response.curl_code = curl_easy_perform(curl.get());
        if (response.curl_code == CURLE_OK) {
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        }
        return response;
    }
};

SpanExtractionClient::SpanExtractionClient(const ExtractionServiceConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

SpanExtractionClient::~SpanExtractionClient() = default;

const ExtractionServiceConfig& SpanExtractionClient::config() const {
    return pimpl_->config_;
}

bool SpanExtractionClient::healthCheck() const {
    auto response = pimpl_->get("/health");
    if (response.curl_code != CURLE_OK || response.status != 200) {
        return false;
    }

    auto j = json::parse(response.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return false;
    }
    return j.value("status", "error") == "ok";
}

Result<std::vector<extraction::Span>> SpanExtractionClient::extract(const std::string& text) const {
    const auto& config = pimpl_->config_;

    json request;
    request["text"] = text;
    request["labels"] = config.labels;
    request["threshold"] = config.threshold;

    auto response = pimpl_->post("/extract", request.dump());

    if (response.curl_code != CURLE_OK) {
        return Result<std::vector<extraction::Span>>(ErrorCode::ML_SERVICE_UNAVAILABLE,
            std::format("Extraction request failed: {}", curl_easy_strerror(response.curl_code)));
    }
    if (response.status != 200) {
        return Result<std::vector<extraction::Span>>(ErrorCode::ML_SERVICE_ERROR,
            std::format("Extraction service returned HTTP {}: {}", response.status, response.body));
    }

    return parseResponse(response.body, text, config.context_window);
}

Result<std::vector<extraction::Span>> SpanExtractionClient::parseResponse(
    const std::string& body, const std::string& text, int64_t context_window) {

    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return Result<std::vector<extraction::Span>>(ErrorCode::ML_SERVICE_ERROR,
            std::format("Malformed extraction response: {}", e.what()));
    }

    if (!j.is_array()) {
        return Result<std::vector<extraction::Span>>(ErrorCode::ML_SERVICE_ERROR,
            "Extraction response is not an array");
    }

    std::vector<extraction::Span> spans;
    spans.reserve(j.size());
    size_t dropped = 0;

    for (const auto& entry : j) {
        bool complete = entry.is_object() &&
                        entry.contains("text") && entry["text"].is_string() &&
                        entry.contains("label") && entry["label"].is_string() &&
                        entry.contains("start") && entry["start"].is_number_integer() &&
                        entry.contains("end") && entry["end"].is_number_integer() &&
                        entry.contains("score") && entry["score"].is_number();
        if (!complete) {
            dropped++;
            continue;
        }

        extraction::Span span;
        span.text = entry["text"].get<std::string>();
        span.label = entry["label"].get<std::string>();
        span.start = entry["start"].get<int64_t>();
        span.end = entry["end"].get<int64_t>();
        span.confidence = entry["score"].get<double>();
        span.context = extraction::contextAround(text, span.start, span.end, context_window);
        spans.push_back(std::move(span));
    }

    if (dropped > 0) {
        std::cerr << std::format("[SpanExtractionClient] Dropped {} incomplete spans", dropped) << std::endl;
    }

    return Result<std::vector<extraction::Span>>(std::move(spans));
}

} // namespace ml
} // namespace slopgraph
