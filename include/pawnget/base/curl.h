#pragma once

#include <pawnget/commands.version.h>

#include <curl/curl.h>

namespace pawnget
{
    CURLcode get_curl_global_init_status() noexcept;
    void curl_set_system_ssl_root_certs(CURL* curl);

    struct CurlEasyHandle
    {
        CurlEasyHandle();
        CurlEasyHandle(CurlEasyHandle&& other) noexcept;
        CurlEasyHandle& operator=(CurlEasyHandle&& other) noexcept;
        ~CurlEasyHandle();

        CURL* get();

    private:
        CURL* m_ptr = nullptr;
    };

    constexpr char pawnget_curl_user_agent[] = "pawnget/" PAWNGET_VERSION_AS_STRING " (curl)";
}
