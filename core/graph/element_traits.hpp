#pragma once

#include <functional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace pathgraph {

// ─── Extractors ────────────────────────────────────────────────
// A graph never inspects user elements directly. Weights and labels
// come from functions supplied at construction time.

template <typename E>
using WeightExtractor = std::function<double(const E&)>;

template <typename T>
using LabelExtractor = std::function<std::string(const T&)>;

namespace detail {

template <typename T, typename = void>
struct is_streamable : std::false_type {};

template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

} // namespace detail

/// Every edge gets the same weight.
template <typename E>
WeightExtractor<E> constantWeight(double weight = 1.0) {
    return [weight](const E&) { return weight; };
}

/// Adapt a callable or pointer-to-member returning an arithmetic
/// value, e.g. weightFrom<Road>(&Road::km).
template <typename E, typename F>
WeightExtractor<E> weightFrom(F source) {
    return [source](const E& element) {
        return static_cast<double>(std::invoke(source, element));
    };
}

/// Streams the value when it supports operator<<.
template <typename T>
std::string defaultLabel(const T& value) {
    if constexpr (detail::is_streamable<T>::value) {
        std::ostringstream out;
        out << value;
        return out.str();
    } else {
        (void)value;
        return "<unlabelled>";
    }
}

template <typename T>
LabelExtractor<T> streamLabel() {
    return [](const T& value) { return defaultLabel(value); };
}

/// Construction-time options for Graph and Digraph.
template <typename V, typename E>
struct GraphOptions {
    std::string name = "graph";                       // used in log lines
    WeightExtractor<E> weight = constantWeight<E>(1.0);
    LabelExtractor<V> vertex_label = streamLabel<V>();
    LabelExtractor<E> edge_label = streamLabel<E>();
};

} // namespace pathgraph
