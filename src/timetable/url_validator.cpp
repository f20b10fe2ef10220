#include "gradia/timetable/url_validator.hpp"
#include "gradia/core/logger.hpp"
#include "gradia/core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace gradia::timetable {

namespace {

auto validation_error(std::string message, std::string_view url) -> VoidResult {
    auto shown = utils::truncate_utf8(url, 128);
    return std::unexpected(
        make_error(ErrorCode::ValidationError, std::move(message), std::move(shown)));
}

auto normalize_domain(std::string_view domain) -> std::string {
    auto d = utils::to_lower(utils::trim(domain));
    while (!d.empty() && d.back() == '.') d.pop_back();
    while (!d.empty() && d.front() == '.') d.erase(d.begin());
    return d;
}

} // anonymous namespace

UrlValidator::UrlValidator(std::vector<std::string> allowed_domains) {
    for (const auto& domain : allowed_domains) {
        auto normalized = normalize_domain(domain);
        if (!normalized.empty()) {
            allowed_domains_.push_back(std::move(normalized));
        }
    }
}

// ---------------------------------------------------------------------------
// Host extraction
// ---------------------------------------------------------------------------

auto UrlValidator::extract_host(std::string_view url) -> std::string {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return {};
    }
    std::string_view rest = url.substr(scheme_end + 3);

    // Authority ends at path, query or fragment
    auto end_pos = rest.find_first_of("/?#");
    std::string_view authority = (end_pos != std::string_view::npos)
        ? rest.substr(0, end_pos)
        : rest;

    // Strip userinfo
    auto at_pos = authority.rfind('@');
    if (at_pos != std::string_view::npos) {
        authority = authority.substr(at_pos + 1);
    }

    // Strip port (bracketed IPv6 literals keep their colons)
    std::string_view host;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        host = (close != std::string_view::npos) ? authority.substr(1, close - 1)
                                                 : std::string_view{};
    } else {
        auto colon = authority.find(':');
        host = (colon != std::string_view::npos) ? authority.substr(0, colon) : authority;
    }

    auto result = utils::to_lower(host);
    while (!result.empty() && result.back() == '.') result.pop_back();
    return result;
}

auto UrlValidator::host_allowed(std::string_view host) const -> bool {
    return std::any_of(allowed_domains_.begin(), allowed_domains_.end(),
        [host](const std::string& domain) {
            if (host == domain) return true;
            return host.size() > domain.size() &&
                   utils::ends_with(host, domain) &&
                   host[host.size() - domain.size() - 1] == '.';
        });
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

auto UrlValidator::validate(std::string_view url) const -> VoidResult {
    if (url.empty()) {
        return validation_error("URL is empty", url);
    }
    if (url.size() > kMaxUrlLength) {
        return validation_error("URL exceeds " + std::to_string(kMaxUrlLength) +
                                " characters", url);
    }
    if (std::any_of(url.begin(), url.end(), [](char c) {
            auto uc = static_cast<unsigned char>(c);
            return std::isspace(uc) || std::iscntrl(uc);
        })) {
        return validation_error("URL contains whitespace or control characters", url);
    }

    auto lowered = utils::to_lower(url.substr(0, 8));
    if (!utils::starts_with(lowered, "http://") && !utils::starts_with(lowered, "https://")) {
        return validation_error("URL must start with http:// or https://", url);
    }

    auto host = extract_host(url);
    if (host.empty()) {
        return validation_error("URL has no host", url);
    }
    if (!host_allowed(host)) {
        LOG_DEBUG("Rejected off-domain URL host '{}'", host);
        return validation_error("URL host '" + host + "' is not an allowed timetable domain",
                                url);
    }
    return {};
}

} // namespace gradia::timetable
