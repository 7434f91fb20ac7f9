#ifndef ARGOT_VALUE_HPP
#define ARGOT_VALUE_HPP

#include <any>
#include <deque>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace argot {

enum class Shape {
    Scalar,
    Collection,
    Map,
};

// Explicit get/set capability for one argument's target. The parser never reaches
// into the target model except through this pair.
template <typename T>
struct Binding {
    std::function<T()> get;
    std::function<void(T)> set;
};

// Binds to a variable owned by the caller; the variable must outlive every parse.
template <typename T>
Binding<T> bindTo(T& target) {
    return Binding<T>{[&target]() { return target; }, [&target](T v) { target = std::move(v); }};
}

// Binds to storage owned by the binding itself; read it back through ParseResult.
template <typename T>
Binding<T> holder(T initial = T{}) {
    auto storage = std::make_shared<T>(std::move(initial));
    return Binding<T>{[storage]() { return *storage; }, [storage](T v) { *storage = std::move(v); }};
}

namespace detail {

template <typename T>
struct ValueTraits {
    static constexpr Shape shape = Shape::Scalar;
    using Element = T;
    static T wrap(Element e) { return e; }
    static std::optional<bool> asBool(const T& v) {
        if constexpr (std::is_same_v<T, bool>) {
            return v;
        } else {
            (void)v;
            return std::nullopt;
        }
    }
};

template <typename E>
struct ValueTraits<std::optional<E>> {
    static constexpr Shape shape = Shape::Scalar;
    using Element = E;
    static std::optional<E> wrap(Element e) { return std::optional<E>(std::move(e)); }
    static std::optional<bool> asBool(const std::optional<E>& v) {
        if constexpr (std::is_same_v<E, bool>) {
            return v;
        } else {
            (void)v;
            return std::nullopt;
        }
    }
};

template <typename E>
struct SequenceTraits {
    static constexpr Shape shape = Shape::Collection;
    using Element = E;
    template <typename C>
    static void add(C& c, Element e) { c.push_back(std::move(e)); }
};

template <typename E>
struct SetTraits {
    static constexpr Shape shape = Shape::Collection;
    using Element = E;
    template <typename C>
    static void add(C& c, Element e) { c.insert(std::move(e)); }
};

template <typename K, typename V>
struct MapTraits {
    static constexpr Shape shape = Shape::Map;
    using Key = K;
    using Mapped = V;
    using Element = V;
    template <typename C>
    static void put(C& c, Key k, Mapped v) { c.insert_or_assign(std::move(k), std::move(v)); }
};

template <typename E, typename A>
struct ValueTraits<std::vector<E, A>> : SequenceTraits<E> {};
template <typename E, typename A>
struct ValueTraits<std::deque<E, A>> : SequenceTraits<E> {};
template <typename E, typename A>
struct ValueTraits<std::list<E, A>> : SequenceTraits<E> {};
template <typename E, typename C, typename A>
struct ValueTraits<std::set<E, C, A>> : SetTraits<E> {};
template <typename E, typename C, typename A>
struct ValueTraits<std::multiset<E, C, A>> : SetTraits<E> {};
template <typename E, typename H, typename Q, typename A>
struct ValueTraits<std::unordered_set<E, H, Q, A>> : SetTraits<E> {};
template <typename K, typename V, typename C, typename A>
struct ValueTraits<std::map<K, V, C, A>> : MapTraits<K, V> {};
template <typename K, typename V, typename H, typename Q, typename A>
struct ValueTraits<std::unordered_map<K, V, H, Q, A>> : MapTraits<K, V> {};

} // namespace detail

// Type-erased view of an argument's target, created from a Binding<T> at build time.
//
// Elements arrive as std::any holding exactly the auxiliary type reported by
// auxiliaryTypes(): the element type for scalars and collections, key and value
// types for maps.
class ValueSlot {
public:
    virtual ~ValueSlot() = default;

    [[nodiscard]] virtual Shape shape() const = 0;
    [[nodiscard]] virtual bool isBoolean() const = 0;
    [[nodiscard]] virtual std::vector<std::type_index> auxiliaryTypes() const = 0;

    // Restores the value the target held when the slot was created.
    virtual void restoreDefault() = 0;
    virtual void assign(const std::any& element) = 0;
    virtual void add(const std::any& element) = 0;
    virtual void put(const std::any& key, const std::any& value) = 0;
    virtual void clear() = 0;

    [[nodiscard]] virtual std::optional<bool> booleanValue() const = 0;
    // The whole current value (T), e.g. std::vector<int>.
    [[nodiscard]] virtual std::any value() const = 0;
};

template <typename T>
class TypedSlot final : public ValueSlot {
public:
    using Traits = detail::ValueTraits<T>;

    explicit TypedSlot(Binding<T> binding) : binding_(std::move(binding)) {
        if (!binding_.get || !binding_.set) throw std::invalid_argument("binding requires both get and set");
        initial_ = binding_.get();
    }

    [[nodiscard]] Shape shape() const override { return Traits::shape; }

    [[nodiscard]] bool isBoolean() const override {
        return Traits::shape == Shape::Scalar && std::is_same_v<typename Traits::Element, bool>;
    }

    [[nodiscard]] std::vector<std::type_index> auxiliaryTypes() const override {
        if constexpr (Traits::shape == Shape::Map) {
            return {std::type_index(typeid(typename Traits::Key)), std::type_index(typeid(typename Traits::Mapped))};
        } else {
            return {std::type_index(typeid(typename Traits::Element))};
        }
    }

    void restoreDefault() override { binding_.set(initial_); }

    void assign(const std::any& element) override {
        if constexpr (Traits::shape == Shape::Scalar) {
            binding_.set(Traits::wrap(std::any_cast<typename Traits::Element>(element)));
        } else {
            (void)element;
            throw std::logic_error("assign() on a multi-valued target");
        }
    }

    void add(const std::any& element) override {
        if constexpr (Traits::shape == Shape::Collection) {
            T current = binding_.get();
            Traits::add(current, std::any_cast<typename Traits::Element>(element));
            binding_.set(std::move(current));
        } else {
            (void)element;
            throw std::logic_error("add() on a target that is not a collection");
        }
    }

    void put(const std::any& key, const std::any& value) override {
        if constexpr (Traits::shape == Shape::Map) {
            T current = binding_.get();
            Traits::put(current, std::any_cast<typename Traits::Key>(key), std::any_cast<typename Traits::Mapped>(value));
            binding_.set(std::move(current));
        } else {
            (void)key;
            (void)value;
            throw std::logic_error("put() on a target that is not a map");
        }
    }

    void clear() override {
        if constexpr (Traits::shape == Shape::Scalar) {
            binding_.set(T{});
        } else {
            T current = binding_.get();
            current.clear();
            binding_.set(std::move(current));
        }
    }

    [[nodiscard]] std::optional<bool> booleanValue() const override {
        if constexpr (Traits::shape == Shape::Scalar) {
            return Traits::asBool(binding_.get());
        } else {
            return std::nullopt;
        }
    }

    [[nodiscard]] std::any value() const override { return binding_.get(); }

private:
    Binding<T> binding_;
    T initial_{};
};

} // namespace argot

#endif // ARGOT_VALUE_HPP
