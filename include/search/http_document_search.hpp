#pragma once

#include "search/idocument_search.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace nlquery {

/**
 * @brief Document search over HTTP
 *
 * POSTs {"query": text, "k": limit} to endpoint + path and expects
 * {"results": [{"text", "metadata", "score"}]}. Connect and read timeouts
 * are both set to the caller's deadline.
 */
class HttpDocumentSearch : public IDocumentSearch {
public:
    struct Config {
        std::string endpoint = "http://127.0.0.1:8001";
        std::string path = "/search";
        std::string api_key;                // sent as Bearer token when set
    };

    explicit HttpDocumentSearch(Config config);

    [[nodiscard]] Result<std::vector<DocumentHit>> search(
        const std::string& text,
        size_t limit,
        std::chrono::milliseconds timeout) override;

    /// Parse a collaborator reply body (exposed for testing)
    [[nodiscard]] static Result<std::vector<DocumentHit>> parse_response(const std::string& body);

    struct Stats {
        uint64_t requests = 0;
        uint64_t errors = 0;
        uint64_t timeouts = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    Config config_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> errors_{0};
    std::atomic<uint64_t> timeouts_{0};
};

} // namespace nlquery
