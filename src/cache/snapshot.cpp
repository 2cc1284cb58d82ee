/**
 * PAGESTASH - Two-Phase HTTP Page Cache
 * Snapshot Implementation - nlohmann::json codec (JSON lists, CBOR responses)
 */

#include "cache/snapshot.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <vector>

namespace pagestash::cache {

namespace {

namespace beast = boost::beast;
namespace http = beast::http;

std::string to_std(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

beast::string_view to_beast(const std::string& s) {
    return beast::string_view(s.data(), s.size());
}

} // namespace

std::string encode_header_list(const HeaderList& header_list) {
    return nlohmann::json(header_list).dump();
}

std::optional<HeaderList> decode_header_list(std::string_view data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        return std::nullopt;
    }

    HeaderList header_list;
    header_list.reserve(j.size());
    for (const auto& item : j) {
        if (!item.is_string()) {
            return std::nullopt;
        }
        header_list.push_back(item.get<std::string>());
    }
    return header_list;
}

std::string encode_response(const pipeline::Response& response) {
    const auto& message = response.message();

    auto headers = nlohmann::json::array();
    for (const auto& field : message) {
        headers.push_back({to_std(field.name_string()), to_std(field.value())});
    }

    const auto& body = message.body();
    nlohmann::json j = {
        {"status", message.result_int()},
        {"version", message.version()},
        {"headers", std::move(headers)},
        {"body", nlohmann::json::binary(std::vector<std::uint8_t>(body.begin(), body.end()))}
    };

    auto cbor = nlohmann::json::to_cbor(j);
    return std::string(cbor.begin(), cbor.end());
}

std::optional<pipeline::Response> decode_response(std::string_view data) {
    auto j = nlohmann::json::from_cbor(data.begin(), data.end(), true, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    try {
        auto status = j.at("status").get<unsigned>();
        auto version = j.value("version", 11u);
        const auto& headers = j.at("headers");
        if (!headers.is_array() || status < 100 || status > 999) {
            return std::nullopt;
        }

        pipeline::Response response;
        auto& message = response.message();
        message.clear();
        message.result(status);
        message.version(version);

        for (const auto& header : headers) {
            if (!header.is_array() || header.size() != 2) {
                return std::nullopt;
            }
            auto name = header[0].get<std::string>();
            auto value = header[1].get<std::string>();
            message.insert(to_beast(name), to_beast(value));
        }

        const auto& body = j.at("body");
        if (!body.is_binary()) {
            return std::nullopt;
        }
        response.set_body(std::string(body.get_binary().begin(), body.get_binary().end()));
        return response;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

} // namespace pagestash::cache
