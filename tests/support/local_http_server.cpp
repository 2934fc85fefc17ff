#include "local_http_server.hpp"

#include <algorithm>
#include <limits>
#include <memory>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace ps3update::test {

namespace {

constexpr std::size_t kNoCut = std::numeric_limits<std::size_t>::max();

} // namespace

LocalHttpServer::LocalHttpServer() {
    server_.set_keep_alive_max_count(1);
    server_.Get(R"(/.*)", [this](const httplib::Request& req, httplib::Response& res) { handle(req, res); });

    port_ = server_.bind_to_any_port("127.0.0.1");
    if (port_ <= 0) {
        throw std::runtime_error("cannot bind the test server to 127.0.0.1");
    }
    listener_ = std::thread([this]() { server_.listen_after_bind(); });
}

LocalHttpServer::~LocalHttpServer() {
    stopping_.store(true);
    server_.stop();
    if (listener_.joinable()) {
        listener_.join();
    }
}

void LocalHttpServer::serve(const std::string& path, Resource resource) {
    std::lock_guard<std::mutex> lock(mutex_);
    Route& route = routes_[path];
    route.drops_left = resource.drop_first;
    route.resource = std::move(resource);
}

std::string LocalHttpServer::baseUrl() const {
    return fmt::format("http://127.0.0.1:{}", port_);
}

std::string LocalHttpServer::url(const std::string& path) const {
    return baseUrl() + path;
}

int LocalHttpServer::getCount(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = routes_.find(path);
    return it == routes_.end() ? 0 : it->second.gets;
}

int LocalHttpServer::rangedGetCount(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = routes_.find(path);
    return it == routes_.end() ? 0 : it->second.ranged_gets;
}

void LocalHttpServer::handle(const httplib::Request& req, httplib::Response& res) {
    const bool ranged = req.has_header("Range");
    const bool trial_range = req.get_header_value("Range") == "bytes=0-0";

    Resource resource;
    bool drop = false;
    bool honor = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = routes_.find(req.path);
        if (it == routes_.end()) {
            res.status = 404;
            return;
        }
        Route& route = it->second;
        resource = route.resource;
        honor = resource.honor_ranges;
        if (req.method == "GET") {
            ++route.gets;
            if (ranged) {
                ++route.ranged_gets;
                if (resource.honor_first_ranges >= 0 && route.ranged_gets > resource.honor_first_ranges) {
                    honor = false;
                }
            }
            if (!trial_range && route.drops_left > 0) {
                --route.drops_left;
                drop = true;
            }
        }
    }

    if (resource.stall) {
        while (!stopping_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        res.status = 503;
        return;
    }

    if (resource.advertise_ranges) {
        res.set_header("Accept-Ranges", "bytes");
    }
    if (resource.status != 200) {
        res.status = resource.status;
        res.set_content(resource.body, "text/plain");
        return;
    }
    if (resource.body.empty()) {
        res.status = 200;
        return;
    }
    // An unset status lets httplib answer the Range header with 206 and Content-Range.
    if (!ranged || !honor) {
        res.status = 200;
    }

    auto body = std::make_shared<const std::string>(std::move(resource.body));
    auto cut_at = std::make_shared<std::size_t>(kNoCut);
    const std::size_t chunk = std::max<std::size_t>(1, resource.chunk_size);
    const auto delay = resource.chunk_delay;
    const std::size_t size = body->size();
    res.set_content_provider(
        size, "application/octet-stream",
        [this, body, cut_at, chunk, delay, drop](std::size_t offset, std::size_t length, httplib::DataSink& sink) {
            if (drop && *cut_at == kNoCut) {
                *cut_at = offset + length / 2;
            }
            if (stopping_.load() || offset >= *cut_at) {
                return false;
            }
            if (delay.count() > 0) {
                std::this_thread::sleep_for(delay);
            }
            const std::size_t n = std::min({chunk, length, *cut_at - offset});
            return sink.write(body->data() + offset, n);
        });
}

} // namespace ps3update::test
