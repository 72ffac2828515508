/**
 * @file UserId.hpp
 * @brief Value Object wrapping the owning user's identifier.
 */

#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace glucosetrail::domain {

/**
 * @class UserId
 * @brief Opaque, non-empty user reference. Identity lives in the account system.
 */
class UserId {
public:
    static UserId create(std::string value) {
        if (value.empty()) {
            throw std::invalid_argument("UserId: User ID cannot be empty.");
        }
        return UserId(std::move(value));
    }

    const std::string& value() const { return m_value; }
    const std::string& toString() const { return m_value; }

    bool operator==(const UserId& other) const { return m_value == other.m_value; }
    bool operator!=(const UserId& other) const { return !(*this == other); }
    bool operator<(const UserId& other) const { return m_value < other.m_value; }

private:
    explicit UserId(std::string value) : m_value(std::move(value)) {}
    std::string m_value;
};

} // namespace glucosetrail::domain

namespace std {
template <>
struct hash<glucosetrail::domain::UserId> {
    std::size_t operator()(const glucosetrail::domain::UserId& id) const noexcept {
        return std::hash<std::string>{}(id.value());
    }
};
} // namespace std
