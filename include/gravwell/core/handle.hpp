#pragma once

/// @file handle.hpp
/// @brief Generational handles and handle-keyed storage for gravwell_core

#include "fwd.hpp"
#include "error.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <vector>

namespace gravwell_core {

// =============================================================================
// Handle Constants
// =============================================================================

namespace handle_constants {
    /// Maximum index value (24 bits)
    constexpr std::uint32_t MAX_INDEX = (1u << 24) - 1;

    /// Null handle bits
    constexpr std::uint32_t NULL_BITS = UINT32_MAX;
}

// =============================================================================
// Handle<T>
// =============================================================================

/// Type-safe generational index handle
/// Layout: [Generation(8 bits) | Index(24 bits)]
template<typename T>
struct Handle {
    std::uint32_t bits = handle_constants::NULL_BITS;

    constexpr Handle() noexcept = default;

    [[nodiscard]] static constexpr Handle create(std::uint32_t index, std::uint8_t generation) noexcept {
        Handle h;
        h.bits = (static_cast<std::uint32_t>(generation) << 24) | (index & handle_constants::MAX_INDEX);
        return h;
    }

    [[nodiscard]] static constexpr Handle null() noexcept {
        return Handle{};
    }

    [[nodiscard]] constexpr bool is_null() const noexcept {
        return bits == handle_constants::NULL_BITS;
    }

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return bits != handle_constants::NULL_BITS;
    }

    [[nodiscard]] constexpr std::uint32_t index() const noexcept {
        return bits & handle_constants::MAX_INDEX;
    }

    [[nodiscard]] constexpr std::uint8_t generation() const noexcept {
        return static_cast<std::uint8_t>(bits >> 24);
    }

    [[nodiscard]] constexpr std::uint32_t to_bits() const noexcept {
        return bits;
    }

    [[nodiscard]] static constexpr Handle from_bits(std::uint32_t raw) noexcept {
        Handle h;
        h.bits = raw;
        return h;
    }

    constexpr bool operator==(const Handle&) const noexcept = default;
    constexpr bool operator!=(const Handle&) const noexcept = default;

    explicit constexpr operator bool() const noexcept {
        return is_valid();
    }
};

// =============================================================================
// HandleAllocator<T>
// =============================================================================

/// Manages allocation and generation tracking for handles
template<typename T>
class HandleAllocator {
public:
    HandleAllocator() = default;

    /// Allocate new handle, reusing freed slots first
    [[nodiscard]] Handle<T> allocate() {
        std::uint32_t index;
        std::uint8_t generation;

        if (!m_free_list.empty()) {
            index = m_free_list.back();
            m_free_list.pop_back();
            generation = m_generations[index];
        } else {
            index = static_cast<std::uint32_t>(m_generations.size());
            if (index > handle_constants::MAX_INDEX) {
                return Handle<T>::null();
            }
            m_generations.push_back(0);
            generation = 0;
        }

        return Handle<T>::create(index, generation);
    }

    /// Free handle (returns false for null or stale handles)
    bool free(Handle<T> handle) {
        if (!is_valid(handle)) {
            return false;
        }

        std::uint32_t index = handle.index();
        m_generations[index] = static_cast<std::uint8_t>(
            (static_cast<std::uint16_t>(m_generations[index]) + 1) % 256
        );
        m_free_list.push_back(index);
        return true;
    }

    [[nodiscard]] bool is_valid(Handle<T> handle) const {
        if (handle.is_null()) {
            return false;
        }
        std::uint32_t index = handle.index();
        if (index >= m_generations.size()) {
            return false;
        }
        return m_generations[index] == handle.generation();
    }

    [[nodiscard]] std::uint8_t generation_at(std::uint32_t index) const {
        if (index >= m_generations.size()) {
            return 0;
        }
        return m_generations[index];
    }

    /// Live handle count
    [[nodiscard]] std::size_t len() const noexcept {
        return m_generations.size() - m_free_list.size();
    }

    void clear() {
        m_generations.clear();
        m_free_list.clear();
    }

private:
    std::vector<std::uint8_t> m_generations;
    std::vector<std::uint32_t> m_free_list;
};

// =============================================================================
// HandleMap<T>
// =============================================================================

/// Contiguous storage keyed by generational handles
template<typename T>
class HandleMap {
public:
    HandleMap() = default;

    /// Insert value and get handle (null when the index space is exhausted)
    [[nodiscard]] Handle<T> insert(T value) {
        Handle<T> handle = m_allocator.allocate();
        if (handle.is_null()) {
            return handle;
        }

        std::uint32_t index = handle.index();
        if (index >= m_values.size()) {
            m_values.resize(index + 1);
        }
        m_values[index] = std::move(value);
        return handle;
    }

    /// Remove value by handle
    [[nodiscard]] std::optional<T> remove(Handle<T> handle) {
        if (!m_allocator.is_valid(handle)) {
            return std::nullopt;
        }

        std::uint32_t index = handle.index();
        std::optional<T> result = std::move(m_values[index]);
        m_values[index].reset();
        m_allocator.free(handle);
        return result;
    }

    [[nodiscard]] const T* get(Handle<T> handle) const {
        if (!contains(handle)) {
            return nullptr;
        }
        return &m_values[handle.index()].value();
    }

    [[nodiscard]] T* get_mut(Handle<T> handle) {
        if (!contains(handle)) {
            return nullptr;
        }
        return &m_values[handle.index()].value();
    }

    [[nodiscard]] bool contains(Handle<T> handle) const {
        return m_allocator.is_valid(handle) &&
               handle.index() < m_values.size() &&
               m_values[handle.index()].has_value();
    }

    [[nodiscard]] std::size_t len() const noexcept {
        return m_allocator.len();
    }

    [[nodiscard]] bool is_empty() const noexcept {
        return len() == 0;
    }

    void clear() {
        m_allocator.clear();
        m_values.clear();
    }

    /// Iterate over all live entries in slot order
    template<typename F>
    void for_each(F&& func) const {
        for (std::size_t i = 0; i < m_values.size(); ++i) {
            if (m_values[i].has_value()) {
                auto index = static_cast<std::uint32_t>(i);
                func(Handle<T>::create(index, m_allocator.generation_at(index)), m_values[i].value());
            }
        }
    }

    /// Look up with a typed error for null and stale handles
    [[nodiscard]] Result<std::reference_wrapper<const T>> get_result(Handle<T> handle) const {
        if (handle.is_null()) {
            return Err<std::reference_wrapper<const T>>(HandleError::null());
        }
        if (!m_allocator.is_valid(handle)) {
            return Err<std::reference_wrapper<const T>>(HandleError::stale());
        }
        const T* ptr = get(handle);
        if (!ptr) {
            return Err<std::reference_wrapper<const T>>(HandleError::out_of_bounds());
        }
        return Ok(std::cref(*ptr));
    }

private:
    HandleAllocator<T> m_allocator;
    std::vector<std::optional<T>> m_values;
};

template<typename T>
std::ostream& operator<<(std::ostream& os, const Handle<T>& h) {
    if (h.is_null()) {
        return os << "Handle(null)";
    }
    return os << "Handle(" << h.index() << "v" << static_cast<int>(h.generation()) << ")";
}

} // namespace gravwell_core
