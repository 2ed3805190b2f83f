/**
 * @file id_list.hpp
 */
#pragma once
#include "topomerge/common/common.hpp"

namespace topomerge
{

/**
 * @brief An ordered set of node identifiers, used for adjacency.
 *
 * @details
 * `IdList` stores unique node IDs in lexicographic order. Lookup is a binary
 * search; insertion keeps the underlying `std::vector` sorted.
 *
 * @par Construction
 * - Default constructible; starts empty with `size() == 0`.
 * - Constructible from a list of IDs; the input is sorted and de-duplicated.
 * - Copy constructible and copy assignable (deep copy; independent of original).
 *
 * @par Value semantics
 * - `add()` and `merge()` are const and return a new list; the receiver is
 *   never modified.
 *
 * @par Invariants
 * - For all `i` in `[1, size())`: `at(i - 1) < at(i)`.
 * - Elements are enumerated in ascending order regardless of insertion order.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Since no method mutates the list, concurrent use of a shared instance is safe.
 */
class IdList
{
public:
    using const_iterator = std::vector<std::string>::const_iterator;

public:
    IdList() = default;

    /**
     * @brief Construct from an arbitrary sequence of IDs.
     * @param ids The IDs to store. Order and duplicates do not matter.
     */
    IdList(std::initializer_list<std::string> ids);

    /**
     * @brief Construct from a vector of IDs.
     * @param ids The IDs to store. Order and duplicates do not matter.
     */
    explicit IdList(std::vector<std::string> ids);

    /**
     * @brief Return a copy of this list with `id` added.
     * @param id The ID to add.
     * @return A new list; equal to `*this` if `id` was already present.
     * @note Complexity: O(n).
     */
    IdList add(const std::string& id) const;

    /**
     * @brief Return the union of this list and `other`.
     * @note Complexity: O(n + m).
     */
    IdList merge(const IdList& other) const;

    /**
     * @brief Check whether `id` is a member of the list.
     * @note Complexity: O(log n).
     */
    bool contains(const std::string& id) const noexcept;

    /**
     * @brief Access the ID at the given position in sorted order.
     * @throw std::out_of_range if `index >= size()`.
     */
    const std::string& at(std::size_t index) const;

    std::size_t size() const noexcept
    {
        return m_ids.size();
    }

    bool empty() const noexcept
    {
        return m_ids.empty();
    }

    const_iterator begin() const noexcept
    {
        return m_ids.begin();
    }

    const_iterator end() const noexcept
    {
        return m_ids.end();
    }

    friend bool operator==(const IdList& lhs, const IdList& rhs)
    {
        return lhs.m_ids == rhs.m_ids;
    }

    friend bool operator!=(const IdList& lhs, const IdList& rhs)
    {
        return !(lhs == rhs);
    }

private:
    /// Sorted, duplicate-free.
    std::vector<std::string> m_ids;
};

} // namespace topomerge
