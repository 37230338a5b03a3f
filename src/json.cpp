#include <ot-cpp/json.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace ot_cpp {

void to_json(nlohmann::json& j, const Retain& r) {
    j = static_cast<std::uint64_t>(r.count);
}

void to_json(nlohmann::json& j, const Insert& i) {
    j = i.text;
}

void to_json(nlohmann::json& j, const Delete& d) {
    if (d.count > max_length) {
        throw std::runtime_error{"delete op length out of range: " + std::to_string(d.count)};
    }
    j = -static_cast<std::int64_t>(d.count);
}

void to_json(nlohmann::json& j, const Op& op) {
    std::visit([&](const auto& o) { to_json(j, o); }, op);
}

void from_json(const nlohmann::json& j, Op& op) {
    if (j.is_string()) {
        auto text = j.get<std::string>();
        if (text.empty()) throw std::runtime_error{"insert op must not be empty"};
        op = Insert{std::move(text)};
    } else if (j.is_number_unsigned()) {
        auto count = j.get<std::uint64_t>();
        if (count == 0) throw std::runtime_error{"op length must not be zero"};
        if (count > max_length) throw std::runtime_error{"retain op length out of range"};
        op = Retain{static_cast<std::size_t>(count)};
    } else if (j.is_number_integer()) {
        auto value = j.get<std::int64_t>();
        if (value == 0) throw std::runtime_error{"op length must not be zero"};
        if (value == std::numeric_limits<std::int64_t>::min()) {
            throw std::runtime_error{"delete op length out of range"};
        }
        if (value > 0) {
            op = Retain{static_cast<std::size_t>(value)};
        } else {
            op = Delete{static_cast<std::size_t>(-value)};
        }
    } else {
        throw std::runtime_error{"cannot convert JSON to op: " + std::string{j.type_name()}};
    }
}

void to_json(nlohmann::json& j, const TextOperation& op) {
    j = nlohmann::json::array();
    for (const auto& o : op) {
        auto element = nlohmann::json{};
        to_json(element, o);
        j.push_back(std::move(element));
    }
}

void from_json(const nlohmann::json& j, TextOperation& op) {
    if (!j.is_array()) {
        throw std::runtime_error{"text operation must be a JSON array"};
    }
    auto builder = OperationBuilder{};
    for (const auto& element : j) {
        auto o = Op{};
        from_json(element, o);
        builder.append(std::move(o));
    }
    op = std::move(builder).build();
}

}  // namespace ot_cpp
