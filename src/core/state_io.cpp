#include "contraption/core/state_io.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>

namespace StateIO {

namespace {

const nlohmann::json* findMember(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) {
        return nullptr;
    }
    auto it = j.find(key);
    if (it == j.end()) {
        return nullptr;
    }
    return &*it;
}

} // namespace

double readDouble(const nlohmann::json& j, const char* key, double fallback) {
    const nlohmann::json* v = findMember(j, key);
    if (!v || !v->is_number()) {
        return fallback;
    }
    return v->get<double>();
}

int readInt(const nlohmann::json& j, const char* key, int fallback) {
    const nlohmann::json* v = findMember(j, key);
    if (!v || !v->is_number_integer()) {
        return fallback;
    }
    return v->get<int>();
}

std::uint64_t readUInt(const nlohmann::json& j, const char* key, std::uint64_t fallback) {
    const nlohmann::json* v = findMember(j, key);
    if (!v) {
        return fallback;
    }
    if (v->is_number_unsigned()) {
        return v->get<std::uint64_t>();
    }
    if (v->is_number_integer() && v->get<std::int64_t>() >= 0) {
        return static_cast<std::uint64_t>(v->get<std::int64_t>());
    }
    return fallback;
}

bool readBool(const nlohmann::json& j, const char* key, bool fallback) {
    const nlohmann::json* v = findMember(j, key);
    if (!v || !v->is_boolean()) {
        return fallback;
    }
    return v->get<bool>();
}

std::string readString(const nlohmann::json& j, const char* key, const std::string& fallback) {
    const nlohmann::json* v = findMember(j, key);
    if (!v || !v->is_string()) {
        return fallback;
    }
    return v->get<std::string>();
}

Components::Color readColor(const nlohmann::json& j, const char* key, const Components::Color& fallback) {
    const nlohmann::json* v = findMember(j, key);
    if (!v || !v->is_array() || v->size() != 3) {
        return fallback;
    }
    uint8_t channels[3];
    for (std::size_t i = 0; i < 3; ++i) {
        const nlohmann::json& c = (*v)[i];
        if (!c.is_number()) {
            return fallback;
        }
        channels[i] = static_cast<uint8_t>(std::clamp(c.get<double>(), 0.0, 255.0));
    }
    return {channels[0], channels[1], channels[2]};
}

nlohmann::json writeColor(const Components::Color& color) {
    return nlohmann::json::array({color.r, color.g, color.b});
}

const nlohmann::json* findArray(const nlohmann::json& j, const char* key) {
    const nlohmann::json* v = findMember(j, key);
    return (v && v->is_array()) ? v : nullptr;
}

const nlohmann::json* findObject(const nlohmann::json& j, const char* key) {
    const nlohmann::json* v = findMember(j, key);
    return (v && v->is_object()) ? v : nullptr;
}

bool writeFile(const std::string& path, const nlohmann::json& state) {
    std::ofstream out(path);
    if (!out) {
        std::cerr << "[StateIO] Cannot open " << path << " for writing\n";
        return false;
    }
    out << state.dump(2) << "\n";
    if (!out) {
        std::cerr << "[StateIO] Write to " << path << " failed\n";
        return false;
    }
    return true;
}

std::optional<nlohmann::json> readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "[StateIO] Cannot open " << path << "\n";
        return std::nullopt;
    }
    nlohmann::json state = nlohmann::json::parse(in, nullptr, false);
    if (state.is_discarded()) {
        std::cerr << "[StateIO] " << path << " is not valid JSON\n";
        return std::nullopt;
    }
    return state;
}

} // namespace StateIO
