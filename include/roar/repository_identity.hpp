// === Repository Identity =====================================================
//
// Canonicalizes repository URLs so that HTTPS and SSH spellings of the same
// repository share one clone. The canonical form doubles as the clone address.

#pragma once

#include <string>
#include <string_view>

namespace roar {

/**
 * @brief Rewrite `http(s)://host/path` to `git@host:path`.
 *
 * SCP-style addresses (`user@host:path`), other schemes and unparseable input
 * are returned unchanged. Never throws on malformed input.
 */
[[nodiscard]] std::string normalize_repository_url(std::string_view repository_url);

/** @brief Cache key `<normalized repository>@<revision>`. */
[[nodiscard]] std::string make_cache_key(std::string_view normalized_repository, std::string_view revision);

}  // namespace roar
