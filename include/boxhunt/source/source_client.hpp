#pragma once

#include <boxhunt/result.hpp>
#include <boxhunt/types.hpp>

#include <memory>
#include <string>
#include <vector>

namespace boxhunt::source {

enum class SourceKind {
    KEYWORD_API,  // One authenticated search request per query
    WEBSITE       // Breadth-first traversal of a site; query is the seed URL
};

inline const char* source_kind_name(SourceKind kind) {
    switch (kind) {
        case SourceKind::KEYWORD_API: return "keyword-api";
        case SourceKind::WEBSITE:     return "website";
    }
    return "unknown";
}

/**
 * Anything that can turn a query into image candidates.
 *
 * search() reports client-level failure (transport error, bad status,
 * malformed payload) as an error result; the Source Manager treats that
 * as zero candidates for this client. Conditions the client itself
 * recovers from (missing credential, an unreachable page mid-crawl) are
 * logged and yield a successful, possibly empty, result.
 */
class SourceClient {
public:
    virtual ~SourceClient() = default;

    virtual std::string name() const = 0;
    virtual SourceKind kind() const = 0;

    virtual Result<std::vector<Candidate>> search(const std::string& query, int limit) = 0;
};

using SourceClientPtr = std::unique_ptr<SourceClient>;

}  // namespace boxhunt::source
