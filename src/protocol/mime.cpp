/*
 * mime.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "mime.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_map>

namespace enclave::protocol {

namespace {

const std::unordered_map<std::string, std::string>& extensionTable() {
    static const std::unordered_map<std::string, std::string> table = {
        // Text
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".csv", "text/csv"},
        {".json", "application/json"},
        {".yaml", "text/yaml"},
        {".yml", "text/yaml"},
        {".xml", "application/xml"},
        {".html", "text/html"},
        {".css", "text/css"},
        {".js", "application/javascript"},
        {".py", "text/x-python"},
        {".ts", "text/typescript"},
        {".log", "text/plain"},
        {".tsv", "text/tab-separated-values"},
        // Images
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".webp", "image/webp"},
        {".bmp", "image/bmp"},
        {".ico", "image/x-icon"},
        // Documents
        {".pdf", "application/pdf"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        // Archives
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        // Data
        {".parquet", "application/octet-stream"},
        {".sqlite", "application/x-sqlite3"},
        {".db", "application/x-sqlite3"},
    };
    return table;
}

constexpr std::array<std::string_view, 9> kBinaryPrefixes = {
    "image/",
    "application/pdf",
    "application/zip",
    "application/gzip",
    "application/x-tar",
    "application/octet-stream",
    "application/x-sqlite3",
    "application/vnd.",
    "application/msword",
};

}  // namespace

std::string inferMimeType(std::string_view path) {
    auto dot = path.rfind('.');
    auto slash = path.rfind('/');
    if (dot == std::string_view::npos ||
        (slash != std::string_view::npos && dot < slash)) {
        return "application/octet-stream";
    }

    std::string ext(path.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& table = extensionTable();
    if (auto it = table.find(ext); it != table.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

bool isBinaryMimeType(std::string_view mimeType) noexcept {
    return std::any_of(kBinaryPrefixes.begin(), kBinaryPrefixes.end(),
                       [mimeType](std::string_view prefix) {
                           return mimeType.starts_with(prefix);
                       });
}

}  // namespace enclave::protocol
