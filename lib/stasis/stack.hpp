// Stasis: A resumable WebAssembly interpreter
// Copyright 2019-2026 The Stasis Authors.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "exceptions.hpp"
#include "value.hpp"
#include <cassert>
#include <cstdint>
#include <utility>
#include <vector>

namespace stasis
{
template <typename T>
class Stack
{
    std::vector<T> m_container;

public:
    void push(T val) { m_container.emplace_back(std::move(val)); }

    template <typename... Args>
    void emplace(Args&&... args)
    {
        m_container.emplace_back(std::forward<Args>(args)...);
    }

    T pop() noexcept
    {
        assert(!m_container.empty());
        auto res = std::move(m_container.back());
        m_container.pop_back();
        return res;
    }

    bool empty() const noexcept { return m_container.empty(); }

    size_t size() const noexcept { return m_container.size(); }

    /// Returns the item at the given position counting from the top (0 is the top item).
    T& operator[](size_t index) noexcept { return m_container[size() - index - 1]; }

    T& top() noexcept { return m_container.back(); }

    void shrink(size_t new_size) noexcept
    {
        assert(new_size <= size());
        m_container.resize(new_size);
    }
};


/// The value stack of an execution: a single sequence of tagged values shared by all frames.
///
/// Every access is checked. An underflow is an engine invariant violation and throws
/// invariant_error, because a validated module never underflows.
class ValueStack
{
    std::vector<Value> m_values;

    [[noreturn]] static void throw_underflow()
    {
        throw invariant_error{"value stack underflow"};
    }

public:
    /// The current number of items on the stack (aka stack height).
    size_t size() const noexcept { return m_values.size(); }

    bool empty() const noexcept { return m_values.empty(); }

    void push(Value value) { m_values.push_back(value); }

    /// Returns an item popped from the top of the stack.
    Value pop()
    {
        if (m_values.empty())
            throw_underflow();
        const auto value = m_values.back();
        m_values.pop_back();
        return value;
    }

    /// Pops the top item and returns it as the given type.
    template <typename T>
    T pop_as()
    {
        return pop().as<T>();
    }

    /// Returns the reference to the top item.
    Value& top()
    {
        if (m_values.empty())
            throw_underflow();
        return m_values.back();
    }

    /// Returns the reference to the stack item on given position from the stack top.
    Value& operator[](size_t index)
    {
        if (index >= m_values.size())
            throw_underflow();
        return m_values[m_values.size() - index - 1];
    }

    /// Pops the top `count` items and returns them in the bottom-to-top order.
    std::vector<Value> pop_n(size_t count)
    {
        if (count > m_values.size())
            throw_underflow();
        const auto first = m_values.end() - static_cast<ptrdiff_t>(count);
        std::vector<Value> result(first, m_values.end());
        m_values.erase(first, m_values.end());
        return result;
    }

    /// Removes the items between `height` and the top `keep` items, i.e. the top `keep` items are
    /// moved down to the given height.
    void drop_below_top(size_t height, size_t keep)
    {
        if (height + keep > m_values.size())
            throw_underflow();
        const auto kept_begin = m_values.end() - static_cast<ptrdiff_t>(keep);
        m_values.erase(m_values.begin() + static_cast<ptrdiff_t>(height), kept_begin);
    }

    void shrink(size_t new_size)
    {
        if (new_size > m_values.size())
            throw_underflow();
        m_values.resize(new_size);
    }

    void clear() noexcept { m_values.clear(); }

    /// Returns iterator to the bottom of the stack.
    std::vector<Value>::const_iterator begin() const noexcept { return m_values.begin(); }

    /// Returns end iterator counting from the bottom of the stack.
    std::vector<Value>::const_iterator end() const noexcept { return m_values.end(); }
};
}  // namespace stasis
