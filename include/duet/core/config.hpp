#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>
#include <memory>
#include <cstdint>
#include <filesystem>

#include <duet/core/error.hpp>

namespace duet::core {

// Forward declarations
class ConfigNode;
struct ConfigList;
using ConfigNodePtr = std::shared_ptr<ConfigNode>;
using ConfigListPtr = std::shared_ptr<ConfigList>;

// Tipe nilai yang didukung dalam konfigurasi
using ConfigValue = std::variant<
    std::nullptr_t,    // Untuk nilai null
    bool,              // Untuk nilai boolean
    int64_t,           // Untuk nilai integer
    double,            // Untuk nilai floating point
    std::string,       // Untuk nilai string
    ConfigListPtr,     // Untuk array
    ConfigNodePtr      // Untuk object/nested config
>;

struct ConfigList {
    std::vector<ConfigValue> items;

    static ConfigListPtr create(std::vector<ConfigValue> items = {}) {
        auto list = std::make_shared<ConfigList>();
        list->items = std::move(items);
        return list;
    }
};

// Class untuk node konfigurasi
class ConfigNode : public std::enable_shared_from_this<ConfigNode> {
public:
    using Map = std::unordered_map<std::string, ConfigValue>;

    ConfigNode() = default;
    explicit ConfigNode(Map values) : values_(std::move(values)) {}

    static ConfigNodePtr create() {
        return std::make_shared<ConfigNode>();
    }

    static ConfigNodePtr create(Map values) {
        return std::make_shared<ConfigNode>(std::move(values));
    }

    // Akses nilai
    template<typename T>
    Result<T> get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return {ErrorCode::FileNotFound, "Configuration key not found: " + key};
        }

        if (const T* value = std::get_if<T>(&it->second)) {
            return *value;
        }
        // Integer boleh dibaca sebagai double
        if constexpr (std::is_same_v<T, double>) {
            if (const int64_t* value = std::get_if<int64_t>(&it->second)) {
                return static_cast<double>(*value);
            }
        }
        return {ErrorCode::InvalidData, "Invalid type for key: " + key};
    }

    // Akses nilai dengan path bertitik, misalnya "relay.port"
    template<typename T>
    Result<T> getPath(std::string_view path) const {
        auto dot = path.find('.');
        if (dot == std::string_view::npos) {
            return get<T>(std::string(path));
        }

        auto child = get<ConfigNodePtr>(std::string(path.substr(0, dot)));
        if (!child) {
            return child.error();
        }
        return child.value()->getPath<T>(path.substr(dot + 1));
    }

    // Nilai dengan fallback jika key tidak ada atau tipenya salah
    template<typename T>
    T value(std::string_view path, T fallback) const {
        auto result = getPath<T>(path);
        return result ? result.value() : std::move(fallback);
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        values_[key] = std::forward<T>(value);
    }

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    void remove(const std::string& key) {
        values_.erase(key);
    }

    // Buat atau dapat nested config
    ConfigNodePtr getOrCreateObject(const std::string& key) {
        auto it = values_.find(key);
        if (it != values_.end()) {
            if (auto* node = std::get_if<ConfigNodePtr>(&it->second)) {
                return *node;
            }
        }
        auto node = create();
        values_[key] = node;
        return node;
    }

    const Map& values() const { return values_; }
    Map& values() { return values_; }

private:
    Map values_;
};

// Class utama untuk konfigurasi
class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) = delete;
    Config& operator=(Config&&) = delete;

    Result<void> loadFromFile(const std::filesystem::path& path);
    Result<void> saveToFile(const std::filesystem::path& path) const;
    Result<void> loadFromString(std::string_view data);
    Result<std::string> saveToString() const;

    ConfigNodePtr root() { return root_; }
    ConfigNodePtr root() const { return root_; }

    template<typename T>
    Result<T> get(std::string_view path) const {
        return root_->getPath<T>(path);
    }

    template<typename T>
    T value(std::string_view path, T fallback) const {
        return root_->value<T>(path, std::move(fallback));
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        root_->set(key, std::forward<T>(value));
    }

    bool has(const std::string& key) const {
        return root_->has(key);
    }

    void remove(const std::string& key) {
        root_->remove(key);
    }

    void clear() {
        root_ = ConfigNode::create();
    }

private:
    Config() : root_(ConfigNode::create()) {}
    ConfigNodePtr root_;
};

// Helper untuk akses global config
inline Config& config() {
    return Config::instance();
}

} // namespace duet::core
