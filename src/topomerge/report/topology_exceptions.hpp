/**
 * @file topology_exceptions.hpp
 */
#pragma once
#include "topomerge/common/common.hpp"

namespace topomerge
{

/**
 * @brief Error codes for Topology operations.
 */
enum class TopologyErrorCode
{
    ValidationFailed
};

/**
 * @brief Exception class for Topology errors.
 *
 * @details
 * `TopologyError` is thrown by `Topology::ensure_valid()` when validation
 * reports one or more violations. The message is the diagnostics summary.
 * All other Topology operations are total and never throw it.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class TopologyError : public std::exception
{
public:
    /**
     * @brief Construct a TopologyError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    TopologyError(TopologyErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    TopologyErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    TopologyErrorCode m_code;
    std::string m_message;
};

} // namespace topomerge
