#include <pawnget/base/checks.h>
#include <pawnget/base/curl.h>
#include <pawnget/base/files.h>
#include <pawnget/base/system.debug.h>
#include <pawnget/base/system.h>

#include <string>
#include <utility>

namespace
{
    using namespace pawnget;

    struct CurlGlobalInit
    {
        CurlGlobalInit() : init_status(curl_global_init(CURL_GLOBAL_DEFAULT)) { }
        ~CurlGlobalInit() { curl_global_cleanup(); }

        CurlGlobalInit(const CurlGlobalInit&) = delete;
        CurlGlobalInit& operator=(const CurlGlobalInit&) = delete;

        CURLcode init_status;
    };

#if defined(__linux__)
    struct CurlCaBundle
    {
        std::string ca_file;
        std::string ca_path;
    };

    // Distributions keep their trust store in different places; libcurl may have been built for another one.
    CurlCaBundle probe_ca_bundle()
    {
        CurlCaBundle bundle;
        bundle.ca_file = get_environment_variable("SSL_CERT_FILE").value_or("");
        bundle.ca_path = get_environment_variable("SSL_CERT_DIR").value_or("");

        if (bundle.ca_file.empty())
        {
            static constexpr StringLiteral cert_files[] = {
                "/etc/ssl/certs/ca-certificates.crt",
                "/etc/pki/tls/certs/ca-bundle.crt",
                "/etc/ssl/ca-bundle.pem",
                "/etc/pki/ca-trust/extracted/pem/tls-ca-bundle.pem",
                "/etc/ssl/cert.pem",
            };

            for (auto&& candidate : cert_files)
            {
                if (real_filesystem.is_regular_file(candidate))
                {
                    bundle.ca_file = candidate.to_string();
                    break;
                }
            }
        }

        if (bundle.ca_path.empty())
        {
            static constexpr StringLiteral cert_dirs[] = {"/etc/ssl/certs", "/etc/pki/tls/certs"};
            for (auto&& candidate : cert_dirs)
            {
                if (real_filesystem.is_directory(candidate))
                {
                    bundle.ca_path = candidate.to_string();
                    break;
                }
            }
        }

        Debug::println("CA bundle: file=", bundle.ca_file, " path=", bundle.ca_path);
        return bundle;
    }
#endif
}

namespace pawnget
{
    CURLcode get_curl_global_init_status() noexcept
    {
        static CurlGlobalInit g_curl_global_init;
        return g_curl_global_init.init_status;
    }

    void curl_set_system_ssl_root_certs(CURL* curl)
    {
#if defined(__linux__)
        static const CurlCaBundle bundle = probe_ca_bundle();
        if (!bundle.ca_file.empty())
        {
            curl_easy_setopt(curl, CURLOPT_CAINFO, bundle.ca_file.c_str());
        }

        if (!bundle.ca_path.empty())
        {
            curl_easy_setopt(curl, CURLOPT_CAPATH, bundle.ca_path.c_str());
        }
#else
        (void)curl;
#endif
    }

    CurlEasyHandle::CurlEasyHandle() { get_curl_global_init_status(); }
    CurlEasyHandle::CurlEasyHandle(CurlEasyHandle&& other) noexcept : m_ptr(std::exchange(other.m_ptr, nullptr)) { }
    CurlEasyHandle& CurlEasyHandle::operator=(CurlEasyHandle&& other) noexcept
    {
        std::swap(m_ptr, other.m_ptr);
        return *this;
    }
    CurlEasyHandle::~CurlEasyHandle()
    {
        if (m_ptr)
        {
            curl_easy_cleanup(m_ptr);
        }
    }
    CURL* CurlEasyHandle::get()
    {
        if (!m_ptr)
        {
            m_ptr = curl_easy_init();
            if (!m_ptr)
            {
                Checks::unreachable(PAWNGET_LINE_INFO);
            }
        }
        return m_ptr;
    }
}
