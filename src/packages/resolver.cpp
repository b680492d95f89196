/*
 * resolver.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "resolver.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <unordered_map>
#include <unordered_set>

namespace enclave::packages {

namespace {

std::string toLower(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

const std::unordered_map<std::string, std::string>& aliasTable() {
    static const std::unordered_map<std::string, std::string> table = {
        {"pil", "pillow"},
        {"PIL", "Pillow"},
        {"cv2", "opencv-python"},
        {"bs4", "beautifulsoup4"},
        {"yaml", "pyyaml"},
        {"sklearn", "scikit-learn"},
        {"skimage", "scikit-image"},
        {"dateutil", "python-dateutil"},
        {"attr", "attrs"},
        {"crypto", "pycryptodome"},
        {"serial", "pyserial"},
        {"gi", "pygobject"},
        {"wx", "wxpython"},
        {"usb", "pyusb"},
    };
    return table;
}

const std::unordered_set<std::string>& prebuiltSet() {
    static const std::unordered_set<std::string> set = {
        "numpy", "pandas", "scipy", "matplotlib", "scikit-learn", "pillow",
        "lxml", "beautifulsoup4", "sqlalchemy", "sympy", "networkx", "shapely",
        "pyyaml", "regex", "jsonschema", "jinja2", "markupsafe", "packaging",
        "certifi", "charset-normalizer", "idna", "urllib3", "six",
        "python-dateutil", "pytz", "setuptools", "wheel", "micropip", "pytest",
        "hypothesis", "attrs", "pluggy", "iniconfig", "tomli", "coverage",
        "cffi", "pycparser", "cryptography", "pyopenssl", "asn1crypto",
        "biopython", "astropy", "gdal", "fiona", "geopandas", "statsmodels",
        "patsy", "seaborn", "bokeh", "tornado", "ruamel.yaml", "msgpack",
        "cbor", "ujson", "orjson", "opencv-python", "pywavelets",
    };
    return set;
}

const std::unordered_map<std::string, std::string_view>& incompatibleTable() {
    static const std::unordered_map<std::string, std::string_view> table = {
        {"pdf2image", "requires the poppler command line utilities"},
        {"tesseract", "requires the Tesseract OCR engine binary"},
        {"psycopg2", "requires the native PostgreSQL client library"},
        {"mysqlclient", "requires the native MySQL client library"},
        {"torch", "requires a native GPU-capable ML runtime"},
        {"tensorflow", "requires a native GPU-capable ML runtime"},
        {"playwright", "requires a headless browser"},
    };
    return table;
}

}  // namespace

std::string PackageResolver::resolveAlias(std::string_view name) {
    const auto& aliases = aliasTable();

    if (auto it = aliases.find(std::string(name)); it != aliases.end()) {
        return it->second;
    }
    if (auto it = aliases.find(toLower(name)); it != aliases.end()) {
        return it->second;
    }
    return std::string(name);
}

std::string PackageResolver::normalize(std::string_view name) {
    auto normalized = toLower(name);
    std::replace(normalized.begin(), normalized.end(), '_', '-');
    return normalized;
}

bool PackageResolver::isValidPackageName(std::string_view name) {
    static const std::regex pattern(R"(^[A-Za-z0-9]([A-Za-z0-9._-]*[A-Za-z0-9])?$)");
    return std::regex_match(name.begin(), name.end(), pattern);
}

bool PackageResolver::isPrebuilt(std::string_view name) {
    return prebuiltSet().contains(normalize(resolveAlias(name)));
}

bool PackageResolver::isIncompatible(std::string_view name) {
    return incompatibleTable().contains(normalize(resolveAlias(name)));
}

PackageClass PackageResolver::classify(std::string_view name) {
    auto canonical = normalize(resolveAlias(name));

    if (prebuiltSet().contains(canonical)) {
        return PackageClass::Prebuilt;
    }
    if (incompatibleTable().contains(canonical)) {
        return PackageClass::Incompatible;
    }
    if (isValidPackageName(canonical)) {
        return PackageClass::Installable;
    }
    return PackageClass::Unknown;
}

ResolvedPackage PackageResolver::resolve(std::string_view name) {
    ResolvedPackage resolved;
    resolved.requested = std::string(name);
    resolved.canonical = resolveAlias(name);
    resolved.cls = classify(name);
    return resolved;
}

std::vector<ResolvedPackage> PackageResolver::resolveAll(
    const std::vector<std::string>& names) {
    std::vector<ResolvedPackage> result;
    std::unordered_set<std::string> seen;

    for (const auto& name : names) {
        auto resolved = resolve(name);
        if (seen.insert(normalize(resolved.canonical)).second) {
            result.push_back(std::move(resolved));
        }
    }
    return result;
}

std::pair<std::vector<std::string>, std::vector<std::string>>
PackageResolver::partition(const std::vector<std::string>& names) {
    std::vector<std::string> installable;
    std::vector<std::string> rejected;
    for (auto& resolved : resolveAll(names)) {
        if (resolved.cls == PackageClass::Incompatible) {
            rejected.push_back(std::move(resolved.requested));
        } else if (resolved.cls != PackageClass::Unknown) {
            installable.push_back(std::move(resolved.canonical));
        }
    }
    return {std::move(installable), std::move(rejected)};
}

std::optional<std::string_view> PackageResolver::getIncompatibleReason(
    std::string_view name) {
    const auto& table = incompatibleTable();
    if (auto it = table.find(normalize(resolveAlias(name))); it != table.end()) {
        return it->second;
    }
    return std::nullopt;
}

}  // namespace enclave::packages
