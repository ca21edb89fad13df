#include <geoserve/update/fetcher.h>

#include <geoserve/storage/file_util.h>

#include <curl/curl.h>

#include <cstdio>
#include <mutex>
#include <unistd.h>

namespace geoserve::update
{
    namespace
    {
        bool EnsureCurlGlobalInit()
        {
            static std::once_flag init_flag;
            static bool init_ok = false;
            std::call_once(init_flag, []()
                           { init_ok = (curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK); });
            return init_ok;
        }

        std::size_t WriteToFile(void *ptr, std::size_t size, std::size_t nmemb, void *stream)
        {
            return std::fwrite(ptr, size, nmemb, static_cast<std::FILE *>(stream));
        }

        int CancelCheck(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
        {
            const auto *cancel = static_cast<const std::atomic<bool> *>(clientp);
            return cancel->load(std::memory_order_relaxed) ? 1 : 0;
        }

        struct CurlHandle
        {
            CURL *h = curl_easy_init();
            ~CurlHandle()
            {
                if (h)
                    curl_easy_cleanup(h);
            }
        };
    } // namespace

    Status CurlFetcher::Fetch(const std::string &url, const std::string &dest_path,
                              const std::atomic<bool> &cancel)
    {
        if (!EnsureCurlGlobalInit())
            return Status::Internal("curl global init failed");

        CurlHandle curl;
        if (curl.h == nullptr)
            return Status::Internal("curl_easy_init failed");

        std::FILE *out = std::fopen(dest_path.c_str(), "wb");
        if (out == nullptr)
            return Status::FromErrno(GeoErrc::IoError, "open " + dest_path);

        curl_easy_setopt(curl.h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.h, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.h, CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.h, CURLOPT_USERAGENT, opt_.user_agent.c_str());
        curl_easy_setopt(curl.h, CURLOPT_TIMEOUT_MS, opt_.timeout_ms);
        curl_easy_setopt(curl.h, CURLOPT_CONNECTTIMEOUT_MS, opt_.connect_timeout_ms);
        curl_easy_setopt(curl.h, CURLOPT_WRITEFUNCTION, WriteToFile);
        curl_easy_setopt(curl.h, CURLOPT_WRITEDATA, out);
        curl_easy_setopt(curl.h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.h, CURLOPT_XFERINFOFUNCTION, CancelCheck);
        curl_easy_setopt(curl.h, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool> *>(&cancel));

        const CURLcode rc = curl_easy_perform(curl.h);
        long http_code = 0;
        curl_easy_getinfo(curl.h, CURLINFO_RESPONSE_CODE, &http_code);

        bool flushed = std::fflush(out) == 0 && ::fsync(::fileno(out)) == 0;
        flushed = (std::fclose(out) == 0) && flushed;

        Status st;
        if (rc == CURLE_ABORTED_BY_CALLBACK)
            st = Status::Cancelled("download cancelled: " + url);
        else if (rc == CURLE_OPERATION_TIMEDOUT)
            st = Status::TimedOut("download timed out: " + url);
        else if (rc != CURLE_OK)
            st = Status::Io(std::string("download failed: ") + curl_easy_strerror(rc) +
                            " http=" + std::to_string(http_code) + " url=" + url);
        else if (http_code != 0 && (http_code < 200 || http_code >= 300))
            st = Status::Io("unexpected HTTP status " + std::to_string(http_code) + " from " + url);
        else if (!flushed)
            st = Status::Io("failed to flush " + dest_path);

        if (!st.ok())
            storage::RemoveIfExists(dest_path);
        return st;
    }
} // namespace geoserve::update
