/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Response implementation
 */

#include "pipeline/response.hpp"

namespace pagestash::pipeline {

namespace {

beast::string_view to_beast(std::string_view sv) {
    return beast::string_view(sv.data(), sv.size());
}

} // namespace

Response::Response()
    : Response(http::status::ok)
{
}

Response::Response(http::status status, std::string body, std::string_view content_type)
    : message_(status, 11)
{
    message_.set(http::field::content_type, to_beast(content_type));
    message_.body() = std::move(body);
}

Response Response::deferred(http::status status, Renderer renderer, std::string_view content_type) {
    Response response(status, {}, content_type);
    response.renderer_ = std::move(renderer);
    response.rendered_ = false;
    return response;
}

bool Response::has_header(std::string_view name) const {
    return message_.find(to_beast(name)) != message_.end();
}

std::optional<std::string> Response::header(std::string_view name) const {
    auto range = message_.equal_range(to_beast(name));
    if (range.first == range.second) {
        return std::nullopt;
    }

    // Repeated fields are one comma-separated list
    std::string joined;
    for (auto it = range.first; it != range.second; ++it) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined.append(it->value().data(), it->value().size());
    }
    return joined;
}

void Response::set_header(std::string_view name, std::string_view value) {
    message_.set(to_beast(name), to_beast(value));
}

void Response::render() {
    if (rendered_) {
        return;
    }

    if (renderer_) {
        message_.body() = renderer_();
    }
    rendered_ = true;
    renderer_ = nullptr;

    auto callbacks = std::move(post_render_callbacks_);
    post_render_callbacks_.clear();
    for (auto& callback : callbacks) {
        callback(*this);
    }
}

void Response::add_post_render_callback(PostRenderCallback callback) {
    if (rendered_) {
        callback(*this);
        return;
    }
    post_render_callbacks_.push_back(std::move(callback));
}

} // namespace pagestash::pipeline
