/**
 * @file id_list.cpp
 */
#include "topomerge/report/id_list.hpp"

#include <iterator>

namespace topomerge
{

IdList::IdList(std::initializer_list<std::string> ids)
    : IdList(std::vector<std::string>(ids))
{
}

IdList::IdList(std::vector<std::string> ids)
    : m_ids(std::move(ids))
{
    std::sort(m_ids.begin(), m_ids.end());
    m_ids.erase(std::unique(m_ids.begin(), m_ids.end()), m_ids.end());
}

IdList IdList::add(const std::string& id) const
{
    IdList result = *this;
    auto it = std::lower_bound(result.m_ids.begin(), result.m_ids.end(), id);
    if (it == result.m_ids.end() || *it != id)
    {
        result.m_ids.insert(it, id);
    }
    return result;
}

IdList IdList::merge(const IdList& other) const
{
    IdList result;
    result.m_ids.reserve(m_ids.size() + other.m_ids.size());
    std::set_union(
        m_ids.begin(), m_ids.end(),
        other.m_ids.begin(), other.m_ids.end(),
        std::back_inserter(result.m_ids));
    return result;
}

bool IdList::contains(const std::string& id) const noexcept
{
    return std::binary_search(m_ids.begin(), m_ids.end(), id);
}

const std::string& IdList::at(std::size_t index) const
{
    if (index >= m_ids.size())
    {
        throw std::out_of_range("IdList::at: index out of range");
    }
    return m_ids[index];
}

} // namespace topomerge
