#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

enum class QueryStatus {
    OK,
    PROVIDER_UNAVAILABLE,
    PROVIDER_FAILED,
    TIMED_OUT
};

// Outcome of one provider call. An OK result with no packages means the
// package genuinely has none; every other status is a lookup error.
struct QueryResult {
    QueryStatus status = QueryStatus::OK;
    std::vector<std::string> packages;
    std::string detail;

    bool ok() const { return status == QueryStatus::OK; }
};

std::string describe_status(QueryStatus status);

// Source of package relationship data. Implementations must be safe to call
// from several query threads at once.
class MetadataProvider {
public:
    virtual ~MetadataProvider() = default;

    virtual QueryResult get_direct_dependencies(const std::string& pkg) = 0;
    virtual QueryResult get_reverse_dependencies(const std::string& pkg) = 0;
};

// Queries an apt-cache compatible executable.
class AptCacheProvider : public MetadataProvider {
public:
    explicit AptCacheProvider(std::string executable = "apt-cache",
                              std::chrono::milliseconds timeout = std::chrono::seconds(10));

    QueryResult get_direct_dependencies(const std::string& pkg) override;
    QueryResult get_reverse_dependencies(const std::string& pkg) override;

    const std::string& executable() const { return executable_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    QueryResult query(const std::string& subcommand, const std::string& pkg,
                      std::vector<std::string> (*parse)(std::string_view));

    const std::string executable_;
    const std::chrono::milliseconds timeout_;
};

// Trims whitespace and strips the angle brackets marking a virtual package.
std::string normalize_package_name(std::string_view raw);

// Output parsers for `apt-cache depends` and `apt-cache rdepends`.
std::vector<std::string> parse_depends_output(std::string_view output);
std::vector<std::string> parse_rdepends_output(std::string_view output);
