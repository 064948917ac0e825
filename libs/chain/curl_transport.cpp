/**
 * @file curl_transport.cpp
 * @brief HttpTransport implemented by spawning curl
 *
 * curl writes the body followed by a final line holding the HTTP status code
 * (-w "\n%{http_code}"), which is split off here.
 */

#include "evmverify/chain.hpp"
#include "evmverify/process.hpp"

#include <charconv>
#include <format>

namespace evmverify::chain {

namespace {

// Extra time granted to the curl process beyond its own --max-time
constexpr std::chrono::seconds kProcessGrace{5};

[[nodiscard]] std::string max_time_arg(std::chrono::milliseconds timeout)
{
    const auto seconds = std::max<long long>(
        1, std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
    return std::to_string(seconds);
}

[[nodiscard]] evmverify::Result<HttpResponse> parse_output(const std::string& url,
                                                           const std::string& output)
{
    const auto newline = output.rfind('\n');
    const std::string_view status_text = newline == std::string::npos
                                             ? std::string_view(output)
                                             : std::string_view(output).substr(newline + 1);
    int status = 0;
    auto [ptr, ec] =
        std::from_chars(status_text.data(), status_text.data() + status_text.size(), status);
    if (ec != std::errc{} || ptr != status_text.data() + status_text.size()) {
        return std::unexpected(Error::make(
            "HttpRequestFailed", std::format("No HTTP status in curl output for {}", url)));
    }
    HttpResponse response;
    response.status = status;
    response.body = newline == std::string::npos ? std::string{} : output.substr(0, newline);
    return response;
}

[[nodiscard]] evmverify::Result<HttpResponse> perform(std::vector<std::string> argv,
                                                      const std::string& url,
                                                      std::chrono::milliseconds timeout)
{
    argv.push_back(url);
    process::ProcessOptions options{.argv = std::move(argv),
                                    .cwd = {},
                                    .timeout = timeout + kProcessGrace};
    auto result = process::run(options);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->timed_out) {
        return std::unexpected(Error::make("HttpTimeout", "Request timed out: " + url));
    }
    if (result->exit_code != 0) {
        return std::unexpected(Error::make(
            "HttpRequestFailed",
            std::format("curl exited with {} for {}: {}", result->exit_code, url,
                        common::trim(result->stderr_output))));
    }
    return parse_output(url, result->stdout_output);
}

}  // namespace

CurlTransport::CurlTransport(std::string curl_binary)
    : m_curl_binary(std::move(curl_binary))
{}

evmverify::Result<HttpResponse> CurlTransport::get(const std::string& url,
                                                   std::chrono::milliseconds timeout)
{
    return perform({m_curl_binary,
                    "-sS",
                    "-L",
                    "--max-time",
                    max_time_arg(timeout),
                    "-H",
                    "Accept: application/json",
                    "-w",
                    "\n%{http_code}"},
                   url,
                   timeout);
}

evmverify::Result<HttpResponse> CurlTransport::post_json(const std::string& url,
                                                         const std::string& body,
                                                         std::chrono::milliseconds timeout)
{
    return perform({m_curl_binary,
                    "-sS",
                    "-L",
                    "--max-time",
                    max_time_arg(timeout),
                    "-X",
                    "POST",
                    "-H",
                    "Content-Type: application/json",
                    "--data-binary",
                    body,
                    "-w",
                    "\n%{http_code}"},
                   url,
                   timeout);
}

}  // namespace evmverify::chain
