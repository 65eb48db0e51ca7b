#include "clouddrive/protocol.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace clouddrive::protocol
{

    namespace
    {

        struct ServiceCodeMapping
        {
            std::string_view service_code;
            ErrorCode code;
        };

        // Graph error codes first, then OAuth2 error codes of the token endpoint.
        constexpr std::array<ServiceCodeMapping, 21> kServiceCodes{{
            {"accessDenied", ErrorCode::AccessDenied},
            {"activityLimitReached", ErrorCode::RetryLater},
            {"serviceNotAvailable", ErrorCode::RetryLater},
            {"invalidRange", ErrorCode::InvalidRequest},
            {"invalidRequest", ErrorCode::InvalidRequest},
            {"malformedRequest", ErrorCode::InvalidRequest},
            {"itemNotFound", ErrorCode::ResourceNotFound},
            {"nameAlreadyExists", ErrorCode::Conflict},
            {"resourceModified", ErrorCode::Conflict},
            {"quotaLimitReached", ErrorCode::QuotaExceeded},
            {"unauthenticated", ErrorCode::ReauthRequired},
            {"InvalidAuthenticationToken", ErrorCode::ReauthRequired},
            {"authorization_pending", ErrorCode::AuthorizationPending},
            {"slow_down", ErrorCode::AuthorizationPending},
            {"authorization_declined", ErrorCode::AuthorizationDeclined},
            {"access_denied", ErrorCode::AuthorizationDeclined},
            {"expired_token", ErrorCode::TokenExpired},
            {"invalid_request", ErrorCode::InvalidRequest},
            {"invalid_grant", ErrorCode::InvalidRequest},
            {"invalid_client", ErrorCode::InvalidRequest},
            {"unauthorized_client", ErrorCode::InvalidRequest},
        }};

        bool parse_digits(std::string_view text, std::size_t &pos, std::size_t count, int &out)
        {
            if (pos + count > text.size())
            {
                return false;
            }
            int value = 0;
            for (std::size_t i = 0; i < count; ++i)
            {
                const auto ch = static_cast<unsigned char>(text[pos + i]);
                if (!std::isdigit(ch))
                {
                    return false;
                }
                value = value * 10 + (ch - '0');
            }
            pos += count;
            out = value;
            return true;
        }

        bool expect(std::string_view text, std::size_t &pos, char ch)
        {
            if (pos >= text.size() || text[pos] != ch)
            {
                return false;
            }
            ++pos;
            return true;
        }

        std::string percent_encode(std::string_view value, bool keep_slash, bool space_as_plus)
        {
            static constexpr char kHexDigits[] = "0123456789ABCDEF";
            std::string result;
            result.reserve(value.size());
            for (const char raw : value)
            {
                const auto ch = static_cast<unsigned char>(raw);
                if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~' || (keep_slash && ch == '/'))
                {
                    result.push_back(raw);
                }
                else if (space_as_plus && ch == ' ')
                {
                    result.push_back('+');
                }
                else
                {
                    result.push_back('%');
                    result.push_back(kHexDigits[(ch >> 4) & 0x0F]);
                    result.push_back(kHexDigits[ch & 0x0F]);
                }
            }
            return result;
        }

    } // namespace

    std::optional<TimePoint> parse_timestamp(std::string_view text)
    {
        std::tm parts{};
        std::size_t pos = 0;
        int year = 0;
        int month = 0;
        int day = 0;
        int hour = 0;
        int minute = 0;
        int second = 0;
        if (!parse_digits(text, pos, 4, year) || !expect(text, pos, '-') || !parse_digits(text, pos, 2, month) ||
            !expect(text, pos, '-') || !parse_digits(text, pos, 2, day))
        {
            return std::nullopt;
        }
        if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' '))
        {
            return std::nullopt;
        }
        ++pos;
        if (!parse_digits(text, pos, 2, hour) || !expect(text, pos, ':') || !parse_digits(text, pos, 2, minute) ||
            !expect(text, pos, ':') || !parse_digits(text, pos, 2, second))
        {
            return std::nullopt;
        }

        std::chrono::nanoseconds fraction{0};
        if (pos < text.size() && text[pos] == '.')
        {
            ++pos;
            std::int64_t scale = 100000000;
            std::int64_t nanos = 0;
            bool any = false;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
            {
                nanos += (text[pos] - '0') * scale;
                scale /= 10;
                ++pos;
                any = true;
            }
            if (!any)
            {
                return std::nullopt;
            }
            fraction = std::chrono::nanoseconds(nanos);
        }

        int offset_seconds = 0;
        if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z'))
        {
            ++pos;
        }
        else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
        {
            const int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int offset_hours = 0;
            int offset_minutes = 0;
            if (!parse_digits(text, pos, 2, offset_hours) || !expect(text, pos, ':') ||
                !parse_digits(text, pos, 2, offset_minutes))
            {
                return std::nullopt;
            }
            offset_seconds = sign * (offset_hours * 3600 + offset_minutes * 60);
        }
        else
        {
            return std::nullopt;
        }
        if (pos != text.size())
        {
            return std::nullopt;
        }

        parts.tm_year = year - 1900;
        parts.tm_mon = month - 1;
        parts.tm_mday = day;
        parts.tm_hour = hour;
        parts.tm_min = minute;
        parts.tm_sec = second;
        const std::time_t utc = timegm(&parts);
        if (utc == static_cast<std::time_t>(-1))
        {
            return std::nullopt;
        }
        const auto base = Clock::from_time_t(utc) - std::chrono::seconds(offset_seconds);
        return base + std::chrono::duration_cast<Clock::duration>(fraction);
    }

    std::string format_timestamp(TimePoint instant)
    {
        const std::time_t seconds = Clock::to_time_t(instant);
        std::tm parts{};
        gmtime_r(&seconds, &parts);
        std::array<char, 32> buffer{};
        const auto length = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ", &parts);
        return std::string(buffer.data(), length);
    }

    void from_json(const nlohmann::json &json, UploadSessionInfo &info)
    {
        info.upload_url = json.value("uploadUrl", std::string{});
        info.expiration.reset();
        if (auto it = json.find("expirationDateTime"); it != json.end() && it->is_string())
        {
            info.expiration = parse_timestamp(it->get<std::string>());
        }
        info.next_expected_ranges.clear();
        if (auto it = json.find("nextExpectedRanges"); it != json.end() && it->is_array())
        {
            info.next_expected_ranges = it->get<std::vector<std::string>>();
        }
    }

    std::optional<std::uint64_t> first_expected_offset(const UploadSessionInfo &info)
    {
        if (info.next_expected_ranges.empty())
        {
            return std::nullopt;
        }
        const auto &range = info.next_expected_ranges.front();
        const auto dash = range.find('-');
        const auto start = range.substr(0, dash);
        if (start.empty())
        {
            return std::nullopt;
        }
        std::uint64_t value = 0;
        for (const char ch : start)
        {
            if (!std::isdigit(static_cast<unsigned char>(ch)))
            {
                return std::nullopt;
            }
            value = value * 10 + static_cast<std::uint64_t>(ch - '0');
        }
        return value;
    }

    void from_json(const nlohmann::json &json, DriveItem &item)
    {
        item.id = json.value("id", std::string{});
        item.name = json.value("name", std::string{});
        item.size = json.value("size", std::uint64_t{0});
        item.is_folder = json.contains("folder");
        item.download_url.reset();
        if (auto it = json.find("@microsoft.graph.downloadUrl"); it != json.end() && it->is_string())
        {
            item.download_url = it->get<std::string>();
        }
    }

    void from_json(const nlohmann::json &json, DeviceCodeResponse &response)
    {
        response.device_code = json.at("device_code").get<std::string>();
        response.user_code = json.at("user_code").get<std::string>();
        response.verification_uri = json.at("verification_uri").get<std::string>();
        response.expires_in = json.value("expires_in", std::int64_t{900});
        response.interval = json.value("interval", std::int64_t{5});
        response.message = json.value("message", std::string{});
    }

    void from_json(const nlohmann::json &json, TokenResponse &response)
    {
        response.access_token = json.at("access_token").get<std::string>();
        response.refresh_token = json.value("refresh_token", std::string{});
        response.token_type = json.value("token_type", std::string{"Bearer"});
        response.expires_in = json.value("expires_in", std::int64_t{0});
        response.scope = json.value("scope", std::string{});
    }

    std::optional<ServiceError> parse_service_error(std::string_view body)
    {
        const auto json = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            return std::nullopt;
        }
        const auto it = json.find("error");
        if (it == json.end())
        {
            return std::nullopt;
        }
        ServiceError error;
        if (it->is_object())
        {
            error.code = it->value("code", std::string{});
            error.message = it->value("message", std::string{});
        }
        else if (it->is_string())
        {
            error.code = it->get<std::string>();
            error.message = json.value("error_description", std::string{});
        }
        else
        {
            return std::nullopt;
        }
        if (error.code.empty())
        {
            return std::nullopt;
        }
        return error;
    }

    std::optional<ErrorCode> error_code_from_service(std::string_view service_code) noexcept
    {
        for (const auto &entry : kServiceCodes)
        {
            if (entry.service_code == service_code)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

    std::string build_path_url(std::string_view remote_path)
    {
        while (!remote_path.empty() && remote_path.front() == '/')
        {
            remote_path.remove_prefix(1);
        }
        if (remote_path.empty())
        {
            return "me/drive/root";
        }
        return "me/drive/root:/" + path_encode(remote_path);
    }

    std::string join_remote_path(std::string_view folder, std::string_view file_name)
    {
        while (!file_name.empty() && file_name.front() == '/')
        {
            file_name.remove_prefix(1);
        }
        while (!folder.empty() && folder.back() == '/')
        {
            folder.remove_suffix(1);
        }
        if (folder.empty())
        {
            return "/" + std::string(file_name);
        }
        std::string result;
        if (folder.front() != '/')
        {
            result.push_back('/');
        }
        result.append(folder);
        result.push_back('/');
        result.append(file_name);
        return result;
    }

    std::string form_encode(std::string_view value)
    {
        return percent_encode(value, false, true);
    }

    std::string path_encode(std::string_view value)
    {
        return percent_encode(value, true, false);
    }

} // namespace clouddrive::protocol
