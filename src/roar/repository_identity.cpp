#include "roar/repository_identity.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <fmt/format.h>

namespace roar {

namespace {

constexpr std::string_view k_scheme_separator{"://"};

struct HttpLocation final {
    std::string_view host{};
    std::string_view path{};
};

bool is_scheme_char(char value) {
    const auto byte = static_cast<unsigned char>(value);
    return std::isalnum(byte) != 0 || value == '+' || value == '-' || value == '.';
}

bool equals_ignore_case(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size()
        && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
}

/** `user@host:path` with no scheme in front. */
bool is_scp_style(std::string_view url) {
    if (url.find(k_scheme_separator) != std::string_view::npos) {
        return false;
    }
    const auto at_pos = url.find('@');
    const auto colon_pos = url.find(':');
    return at_pos != std::string_view::npos && at_pos > 0 && colon_pos != std::string_view::npos && at_pos < colon_pos;
}

std::optional<HttpLocation> parse_http_url(std::string_view url) {
    const auto separator_pos = url.find(k_scheme_separator);
    if (separator_pos == std::string_view::npos || separator_pos == 0) {
        return std::nullopt;
    }
    const std::string_view scheme = url.substr(0, separator_pos);
    if (std::isalpha(static_cast<unsigned char>(scheme.front())) == 0
        || !std::all_of(scheme.begin(), scheme.end(), is_scheme_char)) {
        return std::nullopt;
    }
    if (!equals_ignore_case(scheme, "http") && !equals_ignore_case(scheme, "https")) {
        return std::nullopt;
    }

    std::string_view remainder = url.substr(separator_pos + k_scheme_separator.size());
    const auto suffix_pos = remainder.find_first_of("?#");
    if (suffix_pos != std::string_view::npos) {
        remainder = remainder.substr(0, suffix_pos);
    }

    const auto path_pos = remainder.find('/');
    std::string_view authority = remainder.substr(0, path_pos);
    std::string_view path = path_pos == std::string_view::npos ? std::string_view{} : remainder.substr(path_pos);

    const auto userinfo_pos = authority.rfind('@');
    if (userinfo_pos != std::string_view::npos) {
        authority = authority.substr(userinfo_pos + 1);
    }
    if (authority.empty() || authority.find_first_of(" \t") != std::string_view::npos) {
        return std::nullopt;
    }

    if (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    return HttpLocation{authority, path};
}

}  // namespace

std::string normalize_repository_url(std::string_view repository_url) {
    if (is_scp_style(repository_url)) {
        return std::string{repository_url};
    }
    const std::optional<HttpLocation> location = parse_http_url(repository_url);
    if (!location.has_value()) {
        return std::string{repository_url};
    }
    return fmt::format("git@{}:{}", location->host, location->path);
}

std::string make_cache_key(std::string_view normalized_repository, std::string_view revision) {
    return fmt::format("{}@{}", normalized_repository, revision);
}

}  // namespace roar
