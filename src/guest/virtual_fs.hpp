/*
 * virtual_fs.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file virtual_fs.hpp
 * @brief Per-request filesystem mount under the worker's sandbox root
 * @date 2024
 * @version 1.0.0
 *
 * Guests see virtual paths (/input/data.csv, /output/plot.png). Each maps
 * to the same relative path under the sandbox root; relative mount paths go
 * under /input/. The root is emptied and its standard directories recreated
 * before every request.
 */

#ifndef ENCLAVE_GUEST_VIRTUAL_FS_HPP
#define ENCLAVE_GUEST_VIRTUAL_FS_HPP

#include "protocol/types.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace enclave::guest {

/**
 * @brief Why a mount failed
 */
struct MountError {
    protocol::ErrorKind kind{protocol::ErrorKind::Runtime};
    std::string message;
};

class VirtualFilesystem {
public:
    explicit VirtualFilesystem(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /**
     * @brief Remove everything under the root and recreate input/, output/, tmp/
     */
    [[nodiscard]] std::expected<void, MountError> reset();

    /**
     * @brief Map a virtual path to a host path under the root
     *
     * Relative paths resolve under /input/. A path that normalizes to a
     * location outside the root is a Security error.
     */
    [[nodiscard]] std::expected<std::filesystem::path, MountError> resolve(
        std::string_view virtualPath) const;

    /**
     * @brief Write request files, decoding base64 and creating parents
     */
    [[nodiscard]] std::expected<void, MountError> mount(
        const std::vector<protocol::SandboxFile>& files);

    /**
     * @brief Host path for a guest-supplied absolute path in a mounted area
     *
     * Only /input, /output and /tmp (and paths below them) are mapped;
     * anything else, including host paths already under the root, is left
     * as-is (nullopt).
     */
    [[nodiscard]] std::optional<std::expected<std::filesystem::path, MountError>> mapGuestPath(
        std::string_view path) const;

    /**
     * @brief Collect every regular file under output/, sorted by path
     *
     * UTF-8 content is returned as text, anything else base64 encoded.
     */
    [[nodiscard]] std::vector<protocol::OutputFile> collectOutputs() const;

private:
    std::filesystem::path root_;
};

}  // namespace enclave::guest

#endif  // ENCLAVE_GUEST_VIRTUAL_FS_HPP
