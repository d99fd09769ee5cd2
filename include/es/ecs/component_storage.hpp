#pragma once

/// @file component_storage.hpp
/// @brief Per-kind component storage for the ECS.
///
/// Every component kind declared in an EntityManager schema gets one
/// storage instance.  Storages are addressed by entity index only; the
/// manager validates generations before delegating.  Two strategies are
/// provided behind the same capability interface:
///
/// - DenseStorage<T>: index-addressed array of optional values (baseline).
/// - SparseStorage<T>: sparse set with packed values, for rarely-present
///   kinds.
///
/// A component type picks its strategy with a nested alias
/// (`using Storage = es::ecs::SparseStorage<Self>;`) or by specialising
/// ComponentTraits.  Without either, DenseStorage is used.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace es::ecs {

/// Type-erased base for component storages, allowing EntityManager to
/// purge a deleted entity without knowing the component type.
class IComponentStorage {
public:
    virtual ~IComponentStorage() = default;

    /// Drop the value at @p index.  Returns true if one was present.
    virtual bool Erase(uint32_t index) = 0;

    [[nodiscard]] virtual bool Contains(uint32_t index) const = 0;
    virtual void Clear() = 0;

    /// Number of present values.
    [[nodiscard]] virtual std::size_t Size() const = 0;

    /// Pre-size for indices below @p capacity.
    virtual void Reserve(std::size_t capacity) = 0;
};

/// Typed storage capability shared by all strategies.
template <typename T>
class ComponentStorage : public IComponentStorage {
public:
    static_assert(std::is_move_constructible_v<T>, "Component type must be move-constructible");

    using value_type = T;

    /// Set or overwrite the value at @p index, growing as needed.
    /// @return Reference to the stored value.
    virtual T& Insert(uint32_t index, T value) = 0;

    /// Value at @p index, or nullptr when absent.
    [[nodiscard]] virtual const T* Get(uint32_t index) const = 0;

    /// Mutable value at @p index, or nullptr when absent.
    [[nodiscard]] virtual T* GetMut(uint32_t index) = 0;

    /// Clear @p index to absent, returning the previous value if any.
    virtual std::optional<T> Remove(uint32_t index) = 0;

    bool Erase(uint32_t index) override { return Remove(index).has_value(); }
};

// ── Dense strategy ──────────────────────────────────────────────────────

/// One optional slot per entity index.
///
/// Removal leaves an empty slot behind; the array is never compacted,
/// so lookups stay a single bounds check plus an index.
template <typename T>
class DenseStorage final : public ComponentStorage<T> {
public:
    T& Insert(uint32_t index, T value) override {
        if (index >= slots_.size()) {
            slots_.resize(static_cast<std::size_t>(index) + 1);
        }
        auto& slot = slots_[index];
        if (!slot.has_value()) {
            ++size_;
        }
        slot = std::move(value);
        return *slot;
    }

    [[nodiscard]] const T* Get(uint32_t index) const override {
        if (index >= slots_.size() || !slots_[index].has_value()) {
            return nullptr;
        }
        return &*slots_[index];
    }

    [[nodiscard]] T* GetMut(uint32_t index) override {
        if (index >= slots_.size() || !slots_[index].has_value()) {
            return nullptr;
        }
        return &*slots_[index];
    }

    std::optional<T> Remove(uint32_t index) override {
        if (index >= slots_.size() || !slots_[index].has_value()) {
            return std::nullopt;
        }
        std::optional<T> previous = std::move(slots_[index]);
        slots_[index].reset();
        --size_;
        return previous;
    }

    [[nodiscard]] bool Contains(uint32_t index) const override {
        return index < slots_.size() && slots_[index].has_value();
    }

    void Clear() override {
        for (auto& slot : slots_) {
            slot.reset();
        }
        size_ = 0;
    }

    [[nodiscard]] std::size_t Size() const override { return size_; }

    void Reserve(std::size_t capacity) override { slots_.reserve(capacity); }

    /// Number of addressable slots, present or not.
    [[nodiscard]] std::size_t SlotCount() const noexcept { return slots_.size(); }

private:
    std::vector<std::optional<T>> slots_;
    std::size_t size_ = 0;
};

// ── Sparse strategy ─────────────────────────────────────────────────────

/// Sparse-set storage.
///
/// Memory layout:
/// @code
///   sparse_[entity index] -> dense position  (or kAbsent)
///   dense_ [position]     -> component data
///   owners_[position]     -> entity index that owns dense_[position]
/// @endcode
///
/// Removal swaps the last packed value into the hole, so the packed
/// arrays stay contiguous and only the sparse table grows with the
/// highest index seen.
template <typename T>
class SparseStorage final : public ComponentStorage<T> {
public:
    T& Insert(uint32_t index, T value) override {
        if (auto* existing = GetMut(index)) {
            *existing = std::move(value);
            return *existing;
        }

        ensureSparseSize(index);
        sparse_[index] = static_cast<uint32_t>(dense_.size());
        dense_.push_back(std::move(value));
        owners_.push_back(index);
        return dense_.back();
    }

    [[nodiscard]] const T* Get(uint32_t index) const override {
        return Contains(index) ? &dense_[sparse_[index]] : nullptr;
    }

    [[nodiscard]] T* GetMut(uint32_t index) override {
        return Contains(index) ? &dense_[sparse_[index]] : nullptr;
    }

    std::optional<T> Remove(uint32_t index) override {
        if (!Contains(index)) {
            return std::nullopt;
        }

        const auto pos = sparse_[index];
        const auto lastPos = static_cast<uint32_t>(dense_.size() - 1);
        std::optional<T> previous(std::move(dense_[pos]));

        if (pos != lastPos) {
            // Swap the removed element with the last element.
            dense_[pos] = std::move(dense_[lastPos]);
            owners_[pos] = owners_[lastPos];
            sparse_[owners_[pos]] = pos;
        }

        dense_.pop_back();
        owners_.pop_back();
        sparse_[index] = kAbsent;
        return previous;
    }

    [[nodiscard]] bool Contains(uint32_t index) const override {
        return index < sparse_.size() && sparse_[index] != kAbsent;
    }

    void Clear() override {
        dense_.clear();
        owners_.clear();
        std::fill(sparse_.begin(), sparse_.end(), kAbsent);
    }

    [[nodiscard]] std::size_t Size() const override { return dense_.size(); }

    void Reserve(std::size_t capacity) override { sparse_.reserve(capacity); }

    /// Entity index owning the packed value at @p position.
    [[nodiscard]] uint32_t OwnerAt(std::size_t position) const { return owners_[position]; }

private:
    static constexpr uint32_t kAbsent = std::numeric_limits<uint32_t>::max();

    void ensureSparseSize(uint32_t index) {
        if (index >= sparse_.size()) {
            sparse_.resize(static_cast<std::size_t>(index) + 1, kAbsent);
        }
    }

    std::vector<uint32_t> sparse_;
    std::vector<T> dense_;
    std::vector<uint32_t> owners_;
};

// ── Strategy selection ──────────────────────────────────────────────────

/// Storage strategy for component type @p T.
///
/// Uses `T::Storage` when the type declares one, DenseStorage<T>
/// otherwise.  May be specialised for types that cannot carry the alias.
template <typename T, typename = void>
struct ComponentTraits {
    using Storage = DenseStorage<T>;
};

template <typename T>
struct ComponentTraits<T, std::void_t<typename T::Storage>> {
    using Storage = typename T::Storage;
};

/// Concrete storage type used for component @p T.
template <typename T>
using StorageFor = typename ComponentTraits<T>::Storage;

template <typename T, typename = void>
struct HasComponentName : std::false_type {};

template <typename T>
struct HasComponentName<T, std::void_t<decltype(T::kComponentName)>> : std::true_type {};

/// Diagnostic name of component @p T: `T::kComponentName` when declared,
/// the implementation's type name otherwise.
template <typename T>
std::string_view ComponentName() {
    if constexpr (HasComponentName<T>::value) {
        return T::kComponentName;
    } else {
        return typeid(T).name();
    }
}

}  // namespace es::ecs
