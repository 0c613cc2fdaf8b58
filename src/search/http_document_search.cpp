#include "search/http_document_search.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>

namespace nlquery {

HttpDocumentSearch::HttpDocumentSearch(Config config)
    : config_(std::move(config)) {}

Result<std::vector<DocumentHit>> HttpDocumentSearch::search(
    const std::string& text,
    size_t limit,
    std::chrono::milliseconds timeout) {
    using R = Result<std::vector<DocumentHit>>;
    requests_.fetch_add(1, std::memory_order_relaxed);

    if (config_.endpoint.empty()) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        return R::error(ErrorCategory::INDEX_UNAVAILABLE, "No document search endpoint configured");
    }

    const nlohmann::json body = {{"query", text}, {"k", limit}};

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    const utils::Timer timer;
    const auto res = cli.Post(config_.path, headers, body.dump(), "application/json");

    if (!res) {
        const auto err = res.error();
        if (err == httplib::Error::ConnectionTimeout || err == httplib::Error::Read ||
            timer.elapsed_ms() >= timeout) {
            timeouts_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Document search timed out after {}ms",
                timer.elapsed_ms().count()));
            return R::error(ErrorCategory::TIMEOUT_ERROR,
                std::format("Document search did not answer within {}ms", timeout.count()));
        }
        errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Document search request failed: {}", httplib::to_string(err)));
        return R::error(ErrorCategory::INDEX_UNAVAILABLE,
            std::format("Document search request failed: {}", httplib::to_string(err)));
    }

    if (res->status != httplib::StatusCode::OK_200) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        return R::error(ErrorCategory::INDEX_UNAVAILABLE,
            std::format("Document search returned HTTP {}", res->status));
    }

    auto parsed = parse_response(res->body);
    if (parsed.is_error()) {
        errors_.fetch_add(1, std::memory_order_relaxed);
    }
    return parsed;
}

Result<std::vector<DocumentHit>> HttpDocumentSearch::parse_response(const std::string& body) {
    using R = Result<std::vector<DocumentHit>>;

    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return R::error(ErrorCategory::INDEX_UNAVAILABLE, "Document search reply is not a JSON object");
    }
    const auto it = json.find("results");
    if (it == json.end() || !it->is_array()) {
        return R::error(ErrorCategory::INDEX_UNAVAILABLE, "Document search reply has no results array");
    }

    std::vector<DocumentHit> hits;
    hits.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_object()) continue;
        DocumentHit hit;
        if (const auto t = item.find("text"); t != item.end() && t->is_string()) {
            hit.text = t->get<std::string>();
        }
        if (const auto m = item.find("metadata"); m != item.end() && m->is_object()) {
            for (const auto& [key, value] : m->items()) {
                hit.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
        if (const auto s = item.find("score"); s != item.end() && s->is_number()) {
            hit.score = s->get<double>();
        }
        hits.push_back(std::move(hit));
    }
    return R::ok(std::move(hits));
}

HttpDocumentSearch::Stats HttpDocumentSearch::get_stats() const {
    return {
        .requests = requests_.load(std::memory_order_relaxed),
        .errors = errors_.load(std::memory_order_relaxed),
        .timeouts = timeouts_.load(std::memory_order_relaxed),
    };
}

} // namespace nlquery
