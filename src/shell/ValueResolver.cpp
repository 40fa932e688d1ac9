#include "shell/ValueResolver.hpp"
#include "shell/Error.hpp"
#include "shell/util/lineHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <curl/curl.h>
#include <fmt/core.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

using namespace hs::shell;
using namespace hs::logging;

namespace {
constexpr std::string_view kFileScheme = "file://";
}

bool ValueResolver::isUrl(const std::string& value) {
    return value.starts_with("http://") || value.starts_with("https://");
}

bool ValueResolver::isFileUri(const std::string& value) {
    return value.starts_with(kFileScheme);
}

std::string ValueResolver::resolve(const std::string& value) const {
    if (!enabled()) return value;

    if (isUrl(value)) {
        LogRegistry::remote()->debug("[ValueResolver] Fetching option value from {}", value);
        return trimRight(fetchUrl(value));
    }

    if (isFileUri(value)) {
        const std::filesystem::path path = value.substr(kFileScheme.size());
        LogRegistry::remote()->debug("[ValueResolver] Reading option value from {}", path.string());
        return trimRight(readFile(path));
    }

    return value;
}

CurlValueResolver::CurlValueResolver(config::RemoteConfig cnf) : cnf_(std::move(cnf)) {}

const CurlValueResolver& CurlValueResolver::defaults() {
    static const CurlValueResolver resolver;
    return resolver;
}

size_t CurlValueResolver::curlWriteCallback(void* contents, const size_t size, const size_t nmemb, std::string* s) {
    const size_t newLength = size * nmemb;
    s->append(static_cast<char*>(contents), newLength);
    return newLength;
}

std::string CurlValueResolver::fetchUrl(const std::string& url) const {
    CURL* curl = curl_easy_init();
    if (!curl) throw ShellError::httpError("failed to initialize libcurl");

    std::string response;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, cnf_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(cnf_.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    const CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        const std::string reason = errbuf[0] ? errbuf : curl_easy_strerror(res);
        LogRegistry::remote()->warn("[ValueResolver] GET {} failed: {}", url, reason);
        throw ShellError::httpError(fmt::format("{}: {}", url, reason));
    }

    return response;
}

std::string CurlValueResolver::readFile(const std::filesystem::path& path) const {
    if (std::error_code ec; std::filesystem::is_directory(path, ec))
        throw ShellError::ioError(fmt::format("{}: is a directory", path.string()));

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        throw ShellError::ioError(fmt::format("{}: {}", path.string(), std::strerror(errno)));

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) throw ShellError::ioError(fmt::format("{}: read failed", path.string()));
    return buffer.str();
}
