#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct ManifestEntry {
    std::string name;
    std::string digest;     // lowercase hex MD5
};

// Ordered (block name, digest) list, one entry per block. Stored in md5sum
// format ("<digest>  <name>") so `md5sum -c` can check it on a remote host.
class Manifest {
public:
    Manifest() = default;
    explicit Manifest(std::vector<ManifestEntry> entries);

    // Accepts text and binary mode lines ("digest  name", "digest *name").
    // Blank lines and carriage returns are ignored.
    static Result<Manifest> parse(const std::string& text);
    static Result<Manifest> load(const fs::path& path);

    std::string serialize() const;
    Result<void> save(const fs::path& path) const;

    const std::vector<ManifestEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    std::vector<std::string> names() const;

    // nullptr if name is not listed.
    const ManifestEntry* find(const std::string& name) const;

private:
    std::vector<ManifestEntry> entries_;
};

// Names from the manifest whose file in dir is absent, unreadable or has a
// different digest, in manifest order.
std::vector<std::string> verify_local_blocks(const Manifest& manifest, const fs::path& dir);
