/*
 * guest_guard.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file guest_guard.hpp
 * @brief Interpreter-wide audit hook that bounds what guest code may do
 * @date 2024
 * @version 1.0.0
 *
 * The hook is registered through the C API, so Python code cannot remove
 * it. Once armed it refuses process creation, native code loading,
 * symlink creation and network access, and it checks
 * every audited filesystem operation against an AccessPolicy. Refusals
 * surface in the guest as PermissionError.
 *
 * The guard stays armed after a run returns so threads a guest left
 * behind remain bound by it. All calls must hold the GIL.
 */

#ifndef ENCLAVE_GUEST_GUEST_GUARD_HPP
#define ENCLAVE_GUEST_GUEST_GUARD_HPP

#include "access_policy.hpp"

namespace enclave::guest {

class GuestGuard {
public:
    /**
     * @brief Register the audit hook; later calls do nothing
     * @throws std::runtime_error if the interpreter refuses the hook
     */
    static void install();

    /**
     * @brief Apply a policy to every audited operation from now on
     */
    static void arm(AccessPolicy access);

    [[nodiscard]] static bool isArmed() noexcept;
};

}  // namespace enclave::guest

#endif  // ENCLAVE_GUEST_GUEST_GUARD_HPP
