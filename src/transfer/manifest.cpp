#include "manifest.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/digest.hpp>
#include <cctype>
#include <fstream>
#include <sstream>

static bool is_md5_hex(const std::string& s) {
    if (s.size() != 32) return false;
    for (char c : s) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!hex) return false;
    }
    return true;
}

Manifest::Manifest(std::vector<ManifestEntry> entries) : entries_(std::move(entries)) {}

Result<Manifest> Manifest::parse(const std::string& text) {
    std::vector<ManifestEntry> entries;
    std::istringstream in(strip_cr(text));
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        // "<32 hex>  name" or "<32 hex> *name"
        if (line.size() < 35 || line[32] != ' ' || (line[33] != ' ' && line[33] != '*')) {
            return Result<Manifest>::Err("Malformed manifest line " + std::to_string(line_no) +
                                         ": " + line);
        }
        std::string digest = line.substr(0, 32);
        if (!is_md5_hex(digest)) {
            return Result<Manifest>::Err("Bad digest on manifest line " + std::to_string(line_no));
        }
        for (auto& c : digest) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        entries.push_back({line.substr(34), digest});
    }

    return Result<Manifest>::Ok(Manifest(std::move(entries)));
}

Result<Manifest> Manifest::load(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Manifest>::Err("Cannot read manifest: " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str());
}

std::string Manifest::serialize() const {
    std::string out;
    for (const auto& e : entries_) {
        out += e.digest + "  " + e.name + "\n";
    }
    return out;
}

Result<void> Manifest::save(const fs::path& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Result<void>::Err("Cannot write manifest: " + path.string());
    }
    out << serialize();
    out.close();
    if (!out) {
        return Result<void>::Err("Failed writing manifest: " + path.string());
    }
    return Result<void>::Ok();
}

std::vector<std::string> Manifest::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.name);
    return out;
}

const ManifestEntry* Manifest::find(const std::string& name) const {
    for (const auto& e : entries_) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

std::vector<std::string> verify_local_blocks(const Manifest& manifest, const fs::path& dir) {
    std::vector<std::string> invalid;
    for (const auto& e : manifest.entries()) {
        auto path = dir / e.name;
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            invalid.push_back(e.name);
            continue;
        }
        try {
            if (platform::md5_file(path) != e.digest) {
                invalid.push_back(e.name);
            }
        } catch (const std::runtime_error& ex) {
            nimbus_log(std::string("verify: ") + ex.what());
            invalid.push_back(e.name);
        }
    }
    return invalid;
}
