/*
 * virtual_fs.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "virtual_fs.hpp"
#include "file_codec.hpp"
#include "protocol/mime.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace enclave::guest {

namespace {

constexpr std::array<std::string_view, 3> MOUNT_AREAS = {"input", "output", "tmp"};

/// Lexical containment; both paths must already be normalized
bool isWithin(const fs::path& path, const fs::path& base) {
    auto [baseEnd, pathIt] = std::mismatch(base.begin(), base.end(), path.begin(), path.end());
    return baseEnd == base.end();
}

MountError escapeError(std::string_view path) {
    return MountError{protocol::ErrorKind::Security,
                      fmt::format("Path \"{}\" is not allowed: escapes the sandbox", path)};
}

}  // namespace

VirtualFilesystem::VirtualFilesystem(fs::path root)
    : root_(fs::absolute(std::move(root)).lexically_normal()) {
    // lexically_normal keeps a trailing separator as an empty element
    if (!root_.has_filename()) {
        root_ = root_.parent_path();
    }
}

std::expected<void, MountError> VirtualFilesystem::reset() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return std::unexpected(MountError{
            protocol::ErrorKind::Runtime,
            fmt::format("Failed to create sandbox root {}: {}", root_.string(), ec.message())});
    }

    // The root itself stays: it is the guest's working directory
    std::vector<fs::path> leftovers;
    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        leftovers.push_back(entry.path());
    }
    for (const auto& path : leftovers) {
        fs::remove_all(path, ec);
        if (ec) {
            return std::unexpected(MountError{
                protocol::ErrorKind::Runtime,
                fmt::format("Failed to clear {}: {}", path.string(), ec.message())});
        }
    }

    for (auto area : MOUNT_AREAS) {
        fs::create_directories(root_ / area, ec);
        if (ec) {
            return std::unexpected(MountError{
                protocol::ErrorKind::Runtime,
                fmt::format("Failed to create /{}: {}", area, ec.message())});
        }
    }
    return {};
}

std::expected<fs::path, MountError> VirtualFilesystem::resolve(
    std::string_view virtualPath) const {
    fs::path requested(virtualPath);
    fs::path relative = requested.is_absolute() ? requested.relative_path()
                                                : fs::path("input") / requested;

    auto host = (root_ / relative).lexically_normal();
    if (!isWithin(host, root_) || host == root_) {
        return std::unexpected(escapeError(virtualPath));
    }
    return host;
}

std::expected<void, MountError> VirtualFilesystem::mount(
    const std::vector<protocol::SandboxFile>& files) {
    for (const auto& file : files) {
        auto target = resolve(file.path);
        if (!target) {
            return std::unexpected(target.error());
        }

        std::string bytes;
        if (file.encoding == protocol::FileEncoding::Base64) {
            auto decoded = base64Decode(file.content);
            if (!decoded) {
                return std::unexpected(MountError{
                    protocol::ErrorKind::Runtime,
                    fmt::format("Failed to decode \"{}\": {}", file.path, decoded.error())});
            }
            bytes = std::move(*decoded);
        } else {
            bytes = file.content;
        }

        std::error_code ec;
        fs::create_directories(target->parent_path(), ec);
        if (ec) {
            return std::unexpected(MountError{
                protocol::ErrorKind::Runtime,
                fmt::format("Failed to mount \"{}\": {}", file.path, ec.message())});
        }

        std::ofstream out(*target, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            return std::unexpected(MountError{protocol::ErrorKind::Runtime,
                                              fmt::format("Failed to write \"{}\"", file.path)});
        }
        spdlog::debug("Mounted {} ({} bytes)", target->string(), bytes.size());
    }
    return {};
}

std::optional<std::expected<fs::path, MountError>> VirtualFilesystem::mapGuestPath(
    std::string_view path) const {
    if (!path.starts_with('/')) {
        return std::nullopt;
    }
    // Host paths handed out by getcwd(), abspath() or scandir() already point inside
    if (isWithin(fs::path(path).lexically_normal(), root_)) {
        return std::nullopt;
    }
    for (auto area : MOUNT_AREAS) {
        auto rest = path.substr(1);
        if (rest.starts_with(area) &&
            (rest.size() == area.size() || rest[area.size()] == '/')) {
            auto host = (root_ / fs::path(rest)).lexically_normal();
            if (!isWithin(host, root_)) {
                return std::expected<fs::path, MountError>(std::unexpected(escapeError(path)));
            }
            return std::expected<fs::path, MountError>(std::move(host));
        }
    }
    return std::nullopt;
}

std::vector<protocol::OutputFile> VirtualFilesystem::collectOutputs() const {
    std::vector<protocol::OutputFile> outputs;
    auto outputRoot = root_ / "output";

    std::error_code ec;
    for (fs::recursive_directory_iterator it(outputRoot, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;

        std::ifstream in(it->path(), std::ios::binary);
        std::string content((std::istreambuf_iterator<char>(in)),
                            std::istreambuf_iterator<char>());
        if (!in.good() && !in.eof()) {
            spdlog::warn("Skipping unreadable output file {}", it->path().string());
            continue;
        }

        protocol::OutputFile file;
        file.path = "/" + it->path().lexically_relative(root_).generic_string();
        file.mimeType = protocol::inferMimeType(file.path);
        if (isValidUtf8(content)) {
            file.content = std::move(content);
            file.encoding = protocol::FileEncoding::Text;
        } else {
            file.content = base64Encode(content);
            file.encoding = protocol::FileEncoding::Base64;
        }
        outputs.push_back(std::move(file));
    }

    std::sort(outputs.begin(), outputs.end(),
              [](const auto& a, const auto& b) { return a.path < b.path; });
    return outputs;
}

}  // namespace enclave::guest
