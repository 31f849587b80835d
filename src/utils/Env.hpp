#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Process environment, indexed by variable name.
// Env()["GM_BINARY"] = "/usr/bin/gm" sets it, .find() reads it.
class Env {
   public:
    Env() = default;

    class ValueEntry {
        std::string _key;

       public:
        explicit ValueEntry(const std::string_view key) : _key(key) {}
        ValueEntry() = delete;

        // setenv(3), overwriting any old value
        const ValueEntry& operator=(std::string_view value) const;
        // unsetenv(3)
        void clear() const;
        [[nodiscard]] std::optional<std::string> find() const;
        [[nodiscard]] bool has() const { return find().has_value(); }

        // Copies the value into ref if set.
        bool assign(std::string& ref) const {
            if (auto value = find()) {
                ref = std::move(*value);
                return true;
            }
            return false;
        }
    };

    ValueEntry operator[](const std::string_view key) const {
        return ValueEntry{key};
    }
};
