#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "gradia/core/error.hpp"

namespace gradia::timetable {

/// Rejects malformed or off-domain timetable URLs before any browser
/// resource is spent on them.
class UrlValidator {
public:
    static constexpr size_t kMaxUrlLength = 2048;

    explicit UrlValidator(std::vector<std::string> allowed_domains);

    /// Ok when `url` is an http(s) URL whose host is an allowed domain or
    /// one of its subdomains; ValidationError otherwise.
    [[nodiscard]] auto validate(std::string_view url) const -> VoidResult;

    /// Lowercased host of an http(s) URL with userinfo, port and any
    /// trailing dot removed. Empty when the URL has no scheme separator.
    [[nodiscard]] static auto extract_host(std::string_view url) -> std::string;

    [[nodiscard]] auto allowed_domains() const -> const std::vector<std::string>& {
        return allowed_domains_;
    }

private:
    [[nodiscard]] auto host_allowed(std::string_view host) const -> bool;

    std::vector<std::string> allowed_domains_;
};

} // namespace gradia::timetable
