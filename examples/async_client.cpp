/// @file async_client.cpp
/// @brief Async HTTP fetch
///
/// Runs the coroutine client directly on the runtime. Each URL is fetched
/// as its own task; bodies are streamed chunk by chunk.
///
/// Usage: ./relay_fetch_async <url> [url...]

#include <relay/relay.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace relay;
using namespace relay::http;

namespace {

coro::task<int> fetch_one(client& c, std::string url) {
    auto resp = co_await c.get(url);
    if (!resp) {
        RELAY_LOG_ERROR("GET {} failed: {}", url, resp.error());
        co_return 1;
    }
    RELAY_LOG_INFO("{} -> {} {}", url, resp->status_code(), resp->reason());

    size_t total = 0;
    while (true) {
        auto chunk = co_await resp->body().next_chunk();
        if (!chunk) {
            RELAY_LOG_ERROR("reading body of {} failed: {}", url, chunk.error());
            co_return 1;
        }
        if (chunk->empty()) break;
        total += chunk->size();
        RELAY_LOG_DEBUG("{}: chunk of {} bytes", url, chunk->size());
    }
    RELAY_LOG_INFO("{}: {} body bytes", url, total);
    co_return resp->is_success() ? 0 : 2;
}

coro::task<int> async_main(std::vector<std::string> urls) {
    auto provider = tls::openssl_provider::create();
    if (!provider) {
        RELAY_LOG_ERROR("TLS setup failed: {}", provider.error());
        co_return 1;
    }

    client_config config;
    config.user_agent = "relay-fetch-async/1.0";
    client c(net::connector(*provider), config);

    std::vector<coro::join_handle<int>> handles;
    for (auto& url : urls) {
        handles.push_back(fetch_one(c, url).spawn());
    }

    int status = 0;
    for (auto& h : handles) {
        int code = co_await h;
        if (code != 0 && status == 0) status = code;
    }
    RELAY_LOG_INFO("{} idle connection(s) pooled", c.pool()->idle_count());
    co_return status;
}

} // namespace

int main(int argc, char* argv[]) {
    if (!log::logger::instance().configure_from_env()) {
        RELAY_LOG_WARNING("unknown RELAY_LOG_LEVEL, keeping info");
    }

    if (argc < 2) {
        std::fprintf(stderr, "usage: %s <url> [url...]\n", argv[0]);
        return 64;
    }

    std::vector<std::string> urls(argv + 1, argv + argc);
    return relay::run(async_main(std::move(urls)), 2);
}
