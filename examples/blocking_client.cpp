/// @file blocking_client.cpp
/// @brief Blocking HTTP fetch
///
/// Fetches a URL with the blocking client and prints the body to stdout.
/// The status line and headers go to the log.
///
/// Usage: ./relay_fetch <url> [url...]
/// Set RELAY_LOG_LEVEL=debug|info|warning|error to change verbosity.

#include <relay/relay.hpp>

#include <cstdio>
#include <cstdlib>
#include <thread>
#include <vector>

using namespace relay;

namespace {

int fetch(blocking::client& c, const std::string& url) {
    auto resp = c.get(url);
    if (!resp) {
        RELAY_LOG_ERROR("GET {} failed: {}", url, resp.error());
        return 1;
    }

    RELAY_LOG_INFO("{} {} {}", resp->version(), resp->status_code(), resp->reason());
    for (const auto& [name, value] : resp->get_headers()) {
        RELAY_LOG_INFO("  {}: {}", name, value);
    }

    char buf[4096];
    size_t total = 0;
    while (true) {
        auto n = resp->body().read(buf, sizeof(buf));
        if (!n) {
            RELAY_LOG_ERROR("reading body of {} failed: {}", url, n.error());
            return 1;
        }
        if (*n == 0) break;
        std::fwrite(buf, 1, *n, stdout);
        total += *n;
    }
    RELAY_LOG_INFO("{}: {} body bytes", url, total);
    return resp->is_success() ? 0 : 2;
}

} // namespace

int main(int argc, char* argv[]) {
    if (!log::logger::instance().configure_from_env()) {
        RELAY_LOG_WARNING("unknown RELAY_LOG_LEVEL '{}', keeping info", std::getenv("RELAY_LOG_LEVEL"));
    }

    if (argc < 2) {
        std::fprintf(stderr, "usage: %s <url> [url...]\n", argv[0]);
        return 64;
    }

    auto provider = tls::openssl_provider::create();
    if (!provider) {
        RELAY_LOG_ERROR("TLS setup failed: {}", provider.error());
        return 1;
    }

    blocking::client_options opts;
    opts.worker_threads = 2;
    auto c = blocking::client::create(net::connector(*provider), opts);
    if (!c) {
        RELAY_LOG_ERROR("{}", c.error());
        return 1;
    }

    // Several URLs are fetched from parallel threads sharing one client
    std::vector<int> codes(static_cast<size_t>(argc - 1), 0);
    std::vector<std::thread> threads;
    for (int i = 1; i < argc; ++i) {
        threads.emplace_back([&, i] {
            codes[static_cast<size_t>(i - 1)] = fetch(*c, argv[i]);
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    c->close();

    for (int code : codes) {
        if (code != 0) return code;
    }
    return 0;
}
