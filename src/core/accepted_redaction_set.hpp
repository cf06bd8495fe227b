#ifndef DOCREDACT_CORE_ACCEPTED_REDACTION_SET_HPP
#define DOCREDACT_CORE_ACCEPTED_REDACTION_SET_HPP

#include <algorithm>
#include <string>
#include <vector>
#include "core/errors.hpp"
#include "core/types.hpp"

namespace docredact {
namespace core {

/*
  AcceptedRedactionSet
  --------------------------------
  Ordered set of RedactionRequest, unique on (text, kind). Order is the
  order of acceptance. It is the only input the appliers consume and it is
  a value owned by whoever runs the session.
*/
class AcceptedRedactionSet
{
public:
    AcceptedRedactionSet() = default;

    // -------------------------------------------------------------------------
    // Adds a request. Returns false if an equal (text, kind) entry exists.
    // Empty text is rejected with SessionError.
    // -------------------------------------------------------------------------
    bool Add(const RedactionRequest& request)
    {
        if (request.text.empty()) {
            throw SessionError("cannot accept an empty redaction text");
        }
        if (Contains(request)) {
            return false;
        }
        m_items.push_back(request);
        return true;
    }

    bool Contains(const RedactionRequest& request) const
    {
        return std::find(m_items.begin(), m_items.end(), request) != m_items.end();
    }

    // -------------------------------------------------------------------------
    // Removes the entry at index, returning it. Throws SessionError when the
    // index is out of range.
    // -------------------------------------------------------------------------
    RedactionRequest RemoveAt(size_t index)
    {
        if (index >= m_items.size()) {
            throw SessionError("redaction index " + std::to_string(index) + " out of range");
        }
        RedactionRequest removed = m_items[index];
        m_items.erase(m_items.begin() + static_cast<std::ptrdiff_t>(index));
        return removed;
    }

    // -------------------------------------------------------------------------
    // Distinct literal texts in acceptance order. Two requests that differ
    // only in kind share one literal.
    // -------------------------------------------------------------------------
    std::vector<std::string> Literals() const
    {
        std::vector<std::string> out;
        for (const auto& item : m_items) {
            if (std::find(out.begin(), out.end(), item.text) == out.end()) {
                out.push_back(item.text);
            }
        }
        return out;
    }

    const RedactionRequest& At(size_t index) const { return m_items.at(index); }
    const std::vector<RedactionRequest>& Items() const { return m_items; }
    size_t Size() const { return m_items.size(); }
    bool Empty() const { return m_items.empty(); }

    std::vector<RedactionRequest>::const_iterator begin() const { return m_items.begin(); }
    std::vector<RedactionRequest>::const_iterator end() const { return m_items.end(); }

private:
    std::vector<RedactionRequest> m_items;
};

} // namespace core
} // namespace docredact

#endif // DOCREDACT_CORE_ACCEPTED_REDACTION_SET_HPP
