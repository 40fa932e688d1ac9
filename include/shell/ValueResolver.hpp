#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <string>

namespace hs::shell {

// Remote value primitives used for option values spelled as
// http://..., https://... or file://...
class ValueResolver {
public:
    virtual ~ValueResolver() = default;

    // Substitutes a prefixed value with the fetched text (trailing whitespace removed).
    // Any other value is returned unchanged. Throws HttpError / IoError.
    [[nodiscard]] std::string resolve(const std::string& value) const;

    [[nodiscard]] virtual bool enabled() const { return true; }
    [[nodiscard]] virtual std::string fetchUrl(const std::string& url) const = 0;
    [[nodiscard]] virtual std::string readFile(const std::filesystem::path& path) const = 0;

    static bool isUrl(const std::string& value);
    static bool isFileUri(const std::string& value);
};

// Blocking libcurl GET and std::ifstream reads
class CurlValueResolver final : public ValueResolver {
public:
    explicit CurlValueResolver(config::RemoteConfig cnf = {});

    [[nodiscard]] bool enabled() const override { return cnf_.enabled; }
    [[nodiscard]] std::string fetchUrl(const std::string& url) const override;
    [[nodiscard]] std::string readFile(const std::filesystem::path& path) const override;

    // Shared instance with default settings
    static const CurlValueResolver& defaults();

private:
    config::RemoteConfig cnf_;

    static size_t curlWriteCallback(void* contents, size_t size, size_t nmemb, std::string* s);
};

}
