#include "archi/fetch_file.hpp"

#include <chrono>   // for chrono_literals
#include <cstdint>  // for int32_t

#include <cpr/api.h>
#include <cpr/response.h>
#include <cpr/status_codes.h>
#include <cpr/timeout.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
using namespace std::chrono_literals;

namespace {

auto fetch_file(std::string_view url) noexcept -> std::optional<std::string> {
    auto timeout     = cpr::Timeout{30s};
    auto response    = cpr::Get(cpr::Url{std::string{url}}, timeout);
    auto status_code = static_cast<std::int32_t>(response.status_code);

    static constexpr auto FILE_URL_PREFIX = "file://"sv;
    if (cpr::status::is_success(status_code) || (url.starts_with(FILE_URL_PREFIX) && status_code == 0 && !response.text.empty())) {
        return std::make_optional<std::string>(std::move(response.text));
    }
    spdlog::warn("Failed to fetch '{}' (status {})", url, status_code);
    return std::nullopt;
}

}  // namespace

namespace archi::fetch {

auto fetch_file_from_url(std::string_view url, std::string_view fallback_url) noexcept -> std::optional<std::string> {
    if (auto fetch_content = fetch_file(url); fetch_content) {
        return fetch_content;
    }
    return fetch_file(fallback_url);
}

auto is_url_reachable(std::string_view url) noexcept -> bool {
    auto response    = cpr::Get(cpr::Url{std::string{url}}, cpr::Timeout{15s});
    auto status_code = static_cast<std::int32_t>(response.status_code);
    return cpr::status::is_success(status_code) || cpr::status::is_redirect(status_code);
}

}  // namespace archi::fetch
