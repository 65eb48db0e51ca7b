/**
 * CloudDrive - Wire models of the storage REST API and the OAuth2 endpoints.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "clouddrive/error_codes.hpp"

namespace clouddrive::protocol
{

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    // RFC 3339 timestamps as sent by the service ("2024-05-01T10:00:00.123Z", "+02:00" offsets).
    std::optional<TimePoint> parse_timestamp(std::string_view text);
    std::string format_timestamp(TimePoint instant);

    struct UploadSessionInfo
    {
        std::string upload_url{};
        std::optional<TimePoint> expiration{};
        std::vector<std::string> next_expected_ranges{};
    };

    void from_json(const nlohmann::json &json, UploadSessionInfo &info);

    // Start of the first range the server still expects, if any.
    std::optional<std::uint64_t> first_expected_offset(const UploadSessionInfo &info);

    struct DriveItem
    {
        std::string id{};
        std::string name{};
        std::uint64_t size{};
        bool is_folder{};
        std::optional<std::string> download_url{};
    };

    void from_json(const nlohmann::json &json, DriveItem &item);

    struct DeviceCodeResponse
    {
        std::string device_code{};
        std::string user_code{};
        std::string verification_uri{};
        std::int64_t expires_in{};
        std::int64_t interval{};
        std::string message{};
    };

    void from_json(const nlohmann::json &json, DeviceCodeResponse &response);

    struct TokenResponse
    {
        std::string access_token{};
        std::string refresh_token{};
        std::string token_type{};
        std::int64_t expires_in{};
        std::string scope{};
    };

    void from_json(const nlohmann::json &json, TokenResponse &response);

    // Either {"error":{"code","message"}} or {"error":"...","error_description":"..."}.
    struct ServiceError
    {
        std::string code{};
        std::string message{};
    };

    std::optional<ServiceError> parse_service_error(std::string_view body);

    std::optional<ErrorCode> error_code_from_service(std::string_view service_code) noexcept;

    // Item address relative to the API root: "me/drive/root" or "me/drive/root:/a/b".
    std::string build_path_url(std::string_view remote_path);

    // Joins a remote folder and a file name into an absolute remote path.
    std::string join_remote_path(std::string_view folder, std::string_view file_name);

    // application/x-www-form-urlencoded escaping.
    std::string form_encode(std::string_view value);
    std::string path_encode(std::string_view value);

} // namespace clouddrive::protocol
