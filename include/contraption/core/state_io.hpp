/**
 * @file state_io.hpp
 * @brief Tolerant JSON accessors for snapshot restore
 *
 * Every reader takes the value currently held as its fallback, so a missing
 * or mistyped field leaves the pre-restore value untouched. None of these
 * throw.
 */

#ifndef CONTRAPTION_STATE_IO_HPP
#define CONTRAPTION_STATE_IO_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "contraption/components/basic.hpp"

namespace StateIO {

double readDouble(const nlohmann::json& j, const char* key, double fallback);
int readInt(const nlohmann::json& j, const char* key, int fallback);
std::uint64_t readUInt(const nlohmann::json& j, const char* key, std::uint64_t fallback);
bool readBool(const nlohmann::json& j, const char* key, bool fallback);
std::string readString(const nlohmann::json& j, const char* key, const std::string& fallback);

/** @brief Reads an [r, g, b] triple; out-of-range channels are clamped. */
Components::Color readColor(const nlohmann::json& j, const char* key, const Components::Color& fallback);
nlohmann::json writeColor(const Components::Color& color);

/** @brief Returns the member if it exists and is an array, else nullptr. */
const nlohmann::json* findArray(const nlohmann::json& j, const char* key);

/** @brief Returns the member if it exists and is an object, else nullptr. */
const nlohmann::json* findObject(const nlohmann::json& j, const char* key);

/**
 * @brief Rebuilds @p out from an array member, element by element.
 *
 * Leaves @p out untouched when the member is missing or not an array.
 * Elements that are not objects are skipped.
 */
template <typename T, typename Reader>
void readList(const nlohmann::json& j, const char* key, std::vector<T>& out, Reader read) {
    const nlohmann::json* arr = findArray(j, key);
    if (!arr) {
        return;
    }
    out.clear();
    for (const auto& element : *arr) {
        if (element.is_object()) {
            out.push_back(read(element));
        }
    }
}

/**
 * @brief Writes a snapshot to disk, pretty-printed.
 * @return false (and a log line) if the file cannot be written
 */
bool writeFile(const std::string& path, const nlohmann::json& state);

/**
 * @brief Reads a snapshot from disk.
 * @return std::nullopt (and a log line) if the file is missing or not JSON
 */
std::optional<nlohmann::json> readFile(const std::string& path);

} // namespace StateIO

#endif
