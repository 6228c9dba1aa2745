/**
 * @file runtime.hpp
 * @brief IRuntimeStrategy, one invocation strategy per runtime tag.
 *
 * Strategies are registered with the FunctionExecutor at startup and looked
 * up by tag for every invocation. Tests register in-process fakes the same way.
 */

#pragma once

#include "blob/blob_store.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/temp_workspace.hpp"
#include "functions/registration.hpp"

#include <stop_token>
#include <string>
#include <string_view>

namespace cloudlet {

struct InvocationRequest {
    const FunctionRegistration& registration;
    const BlobObject& code;
    const Bytes& input;
    const TempWorkspace& workspace;             ///< Private scratch directory, owned by the caller
    SteadyTime deadline;
};

struct InvocationOutcome {
    enum class Status : uint8_t {
        Completed,
        Failed,
        TimedOut,
        Cancelled
    };

    Status status{Status::Failed};
    Bytes output;
    int exit_code{0};
    std::string detail;                         ///< Failure description
};

class IRuntimeStrategy {
public:
    virtual ~IRuntimeStrategy() = default;

    /// Tag matched against FunctionRegistration::runtime.
    [[nodiscard]] virtual std::string_view tag() const noexcept = 0;

    /**
     * @brief Check that the entrypoint resolves for this runtime.
     *
     * Fails with ValidationFailed describing what could not be resolved.
     */
    virtual Result<void> verify(const FunctionRegistration& registration,
                                const BlobObject& code,
                                const TempWorkspace& workspace) = 0;

    /**
     * @brief Run the function. Must honour the deadline and @p stop, and must
     *        not leave any process or thread running after it returns.
     */
    virtual InvocationOutcome invoke(const InvocationRequest& request, std::stop_token stop) = 0;
};

}  // namespace cloudlet
