#include <pawnget/base/curl.h>
#include <pawnget/base/downloads.h>
#include <pawnget/base/files.h>
#include <pawnget/base/messages.h>
#include <pawnget/base/strings.h>
#include <pawnget/base/system.debug.h>

#include <algorithm>

using namespace pawnget;

namespace
{
    // abandon transfers that stay below this many bytes per second for this many seconds
    constexpr long low_speed_limit_bytes = 1;
    constexpr long low_speed_time_seconds = 60;

    std::string url_encode_spaces(StringView url)
    {
        std::string result;
        for (auto ch : url)
        {
            if (ch == ' ')
            {
                result.append("%20");
            }
            else
            {
                result.push_back(ch);
            }
        }

        return result;
    }

    struct TransferState
    {
        WriteFilePointer* out;
        const CancellationToken* cancel;
        bool short_write;
    };

    size_t write_file_callback(void* contents, size_t size, size_t nmemb, void* param)
    {
        auto state = static_cast<TransferState*>(param);
        const auto written = state->out->write(contents, size, nmemb);
        if (written != nmemb)
        {
            state->short_write = true;
        }

        return written * size;
    }

    int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t)
    {
        auto state = static_cast<TransferState*>(clientp);
        if (state->cancel->is_cancelled())
        {
            return 1;
        }

        if (dltotal)
        {
            Debug::println("downloaded ", static_cast<long long>(dlnow), " of ", static_cast<long long>(dltotal));
        }

        return 0;
    }

    LocalizedString format_curl_error(StringView url, CURLcode code)
    {
        return msg::format(msgDownloadFailed, msg::url = url)
            .append_raw('\n')
            .append(msgCurlFailedGeneric, msg::exit_code = static_cast<int>(code))
            .append_raw(fmt::format(" ({})", curl_easy_strerror(code)));
    }
}

namespace pawnget
{
    Optional<SplitUrlView> parse_split_url_view(StringView raw_url)
    {
        auto sep = std::find(raw_url.begin(), raw_url.end(), ':');
        if (sep == raw_url.end() || sep == raw_url.begin())
        {
            return nullopt;
        }

        StringView scheme(raw_url.begin(), sep);
        if (StringView{sep + 1, raw_url.end()}.starts_with("//"))
        {
            auto path_start = std::find(sep + 3, raw_url.end(), '/');
            return SplitUrlView{scheme, StringView{sep + 1, path_start}, StringView{path_start, raw_url.end()}};
        }

        // no authority
        return SplitUrlView{scheme, nullopt, StringView{sep + 1, raw_url.end()}};
    }

    StringView url_filename(const SplitUrlView& url) noexcept
    {
        const auto& pqf = url.path_query_fragment;
        auto path_end = std::find_if(pqf.begin(), pqf.end(), [](char ch) { return ch == '?' || ch == '#'; });
        auto segment_start = std::find(std::make_reverse_iterator(path_end), std::make_reverse_iterator(pqf.begin()), '/');
        return StringView{segment_start.base(), path_end};
    }

    bool is_well_formed_download_url(StringView raw_url)
    {
        auto maybe_split = parse_split_url_view(raw_url);
        auto split = maybe_split.get();
        if (!split)
        {
            return false;
        }

        if (!std::all_of(split->scheme.begin(), split->scheme.end(), [](char ch) {
                return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
                       ch == '+' || ch == '-' || ch == '.';
            }))
        {
            return false;
        }

        auto authority = split->authority.get();
        if (!authority || authority->size() <= 2)
        {
            return false;
        }

        if (Strings::find_first_of(*authority, " \t\r\n") != authority->end())
        {
            return false;
        }

        return !url_filename(*split).empty();
    }

    ExpectedL<Unit> download_to_file_pointer(StringView url, WriteFilePointer& out, const CancellationToken& cancel)
    {
        if (get_curl_global_init_status() != CURLE_OK)
        {
            return format_curl_error(url, get_curl_global_init_status());
        }

        if (cancel.cancel_requested())
        {
            return msg::format(msgDownloadCancelled, msg::url = url);
        }

        if (cancel.deadline_passed())
        {
            return msg::format(msgDownloadFailed, msg::url = url).append_raw('\n').append(msgCurlDownloadTimeout);
        }

        TransferState state{&out, &cancel, false};

        CurlEasyHandle handle;
        CURL* curl = handle.get();
        const auto encoded_url = url_encode_spaces(url);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, pawnget_curl_user_agent);
        curl_easy_setopt(curl, CURLOPT_URL, encoded_url.c_str());
        curl_easy_setopt(curl,
                         CURLOPT_FOLLOWLOCATION,
                         2L); // Follow redirects, change request method based on HTTP response code.
                              // https://curl.se/libcurl/c/CURLOPT_FOLLOWLOCATION.html#CURLFOLLOWOBEYCODE
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, low_speed_limit_bytes);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, low_speed_time_seconds);
        curl_set_system_ssl_root_certs(curl);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_file_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, static_cast<void*>(&state));
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L); // change from default to enable progress
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, static_cast<void*>(&state));

        Debug::println("Downloading ", url, " to ", out.path());
        const auto curl_code = curl_easy_perform(curl);
        if (curl_code == CURLE_ABORTED_BY_CALLBACK)
        {
            if (cancel.cancel_requested())
            {
                return msg::format(msgDownloadCancelled, msg::url = url);
            }

            return msg::format(msgDownloadFailed, msg::url = url).append_raw('\n').append(msgCurlDownloadTimeout);
        }

        if (curl_code == CURLE_OPERATION_TIMEDOUT)
        {
            return msg::format(msgDownloadFailed, msg::url = url).append_raw('\n').append(msgCurlDownloadTimeout);
        }

        if (curl_code == CURLE_WRITE_ERROR && state.short_write)
        {
            return msg::format(msgDownloadFailed, msg::url = url)
                .append_raw('\n')
                .append(msgCurlShortWrite, msg::path = out.path());
        }

        if (curl_code != CURLE_OK)
        {
            return format_curl_error(url, curl_code);
        }

        long response_code = -1;
        const auto get_info_code = curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
        if (get_info_code != CURLE_OK)
        {
            return format_curl_error(url, get_info_code);
        }

        // file:// transfers have no response code
        if ((response_code >= 200 && response_code < 300) || (url.starts_with("file://") && response_code == 0))
        {
            return Unit{};
        }

        return msg::format(msgCurlFailedHttpResponse, msg::url = url, msg::exit_code = static_cast<int>(response_code));
    }
}
