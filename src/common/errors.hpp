#pragma once

#include <exception>
#include <stdexcept>
#include <string>

#include "common/enums.hpp"

namespace histscrub {

// Thrown by the engine's mutation steps. Caught at the store boundary and
// folded into a MutationResult; never allowed to reach sibling stores.
class SweepError : public std::runtime_error {
public:
    SweepError(ErrorKind kind, const std::string &detail)
        : std::runtime_error(detail)
        , m_kind(kind)
    {
    }

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

// Runs one step, mapping any non-SweepError exception to `kind`.
template <typename Fn>
auto guarded(ErrorKind kind, const char *step, Fn &&fn) -> decltype(fn())
{
    try {
        return fn();
    } catch (const SweepError &) {
        throw;
    } catch (const std::exception &e) {
        throw SweepError(kind, std::string(step) + ": " + e.what());
    }
}

} // namespace histscrub
