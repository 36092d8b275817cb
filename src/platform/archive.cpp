#include "archive.hpp"
#include <core/constants.hpp>
#include <archive.h>
#include <archive_entry.h>
#include <sys/stat.h>
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace platform {

namespace {

using WriterPtr = std::unique_ptr<struct archive, decltype(&archive_write_free)>;
using ReaderPtr = std::unique_ptr<struct archive, decltype(&archive_read_free)>;
using EntryPtr = std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)>;

std::string archive_err(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

int add_filter(struct archive* a, ArchiveFilter filter) {
    switch (filter) {
    case ArchiveFilter::Zstd: return archive_write_add_filter_zstd(a);
    case ArchiveFilter::Gzip: return archive_write_add_filter_gzip(a);
    }
    return ARCHIVE_FATAL;
}

int support_read_filter(struct archive* a, ArchiveFilter filter) {
    switch (filter) {
    case ArchiveFilter::Zstd: return archive_read_support_filter_zstd(a);
    case ArchiveFilter::Gzip: return archive_read_support_filter_gzip(a);
    }
    return ARCHIVE_FATAL;
}

// The name the source is stored under: its last path component.
fs::path archive_root_name(const fs::path& source) {
    fs::path abs = fs::absolute(source).lexically_normal();
    if (abs.filename().empty()) abs = abs.parent_path();
    if (abs.filename().empty() || abs == abs.root_path()) {
        throw std::runtime_error("Cannot archive a filesystem root: " + source.string());
    }
    return abs.filename();
}

void write_entry(struct archive* a, struct archive_entry* entry,
                 const fs::path& full_path, const std::string& name) {
    struct stat st;
    if (lstat(full_path.c_str(), &st) != 0) {
        throw std::runtime_error("Cannot stat " + full_path.string());
    }

    bool is_reg = S_ISREG(st.st_mode);
    bool is_dir = S_ISDIR(st.st_mode);
    bool is_lnk = S_ISLNK(st.st_mode);
    if (!is_reg && !is_dir && !is_lnk) return;  // sockets, fifos, devices

    archive_entry_clear(entry);
    archive_entry_copy_stat(entry, &st);
    archive_entry_set_pathname(entry, name.c_str());

    if (is_lnk) {
        auto target = fs::read_symlink(full_path);
        archive_entry_set_symlink(entry, target.c_str());
        archive_entry_set_size(entry, 0);
    } else if (is_dir) {
        archive_entry_set_size(entry, 0);
    }

    std::ifstream in;
    if (is_reg) {
        in.open(full_path, std::ios::binary);
        if (!in) throw std::runtime_error("Cannot read " + full_path.string());
    }

    if (archive_write_header(a, entry) < ARCHIVE_WARN) {
        throw std::runtime_error("Failed to add " + name + ": " + archive_err(a));
    }

    if (!is_reg) return;

    // Write file contents in chunks
    std::vector<char> buf(ARCHIVE_BUF_SIZE);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto bytes_read = in.gcount();
        if (bytes_read > 0 &&
            archive_write_data(a, buf.data(), static_cast<size_t>(bytes_read)) < 0) {
            throw std::runtime_error("Failed to write " + name + ": " + archive_err(a));
        }
    }
    if (in.bad()) throw std::runtime_error("Error reading " + full_path.string());
}

// Feeds a sequence of part files to libarchive as one continuous stream.
struct PartStream {
    std::vector<fs::path> parts;
    size_t next = 0;
    bool consume = false;
    std::ifstream current;
    fs::path current_path;
    bool open = false;
    std::vector<char> buf = std::vector<char>(ARCHIVE_BUF_SIZE);
};

la_ssize_t read_parts(struct archive* a, void* client, const void** buffer) {
    auto* ps = static_cast<PartStream*>(client);
    for (;;) {
        if (!ps->open) {
            if (ps->next >= ps->parts.size()) return 0;
            ps->current_path = ps->parts[ps->next++];
            ps->current.open(ps->current_path, std::ios::binary);
            if (!ps->current) {
                archive_set_error(a, EIO, "Cannot open block %s", ps->current_path.c_str());
                return -1;
            }
            ps->open = true;
        }

        ps->current.read(ps->buf.data(), static_cast<std::streamsize>(ps->buf.size()));
        auto n = ps->current.gcount();
        if (n > 0) {
            *buffer = ps->buf.data();
            return static_cast<la_ssize_t>(n);
        }
        if (ps->current.bad()) {
            archive_set_error(a, EIO, "Error reading block %s", ps->current_path.c_str());
            return -1;
        }

        ps->current.close();
        ps->current.clear();
        ps->open = false;
        if (ps->consume) {
            std::error_code ec;
            fs::remove(ps->current_path, ec);
        }
    }
}

void copy_entry_data(struct archive* in, struct archive* out) {
    const void* buff;
    size_t size;
    la_int64_t offset;
    for (;;) {
        int r = archive_read_data_block(in, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) return;
        if (r < ARCHIVE_WARN) {
            throw std::runtime_error("Corrupt archive data: " + archive_err(in));
        }
        if (archive_write_data_block(out, buff, size, offset) < ARCHIVE_WARN) {
            throw std::runtime_error("Failed to write extracted data: " + archive_err(out));
        }
    }
}

} // namespace

bool filter_supported(ArchiveFilter filter) {
    WriterPtr w(archive_write_new(), archive_write_free);
    if (!w) return false;
    archive_write_set_format_pax_restricted(w.get());
    if (add_filter(w.get(), filter) != ARCHIVE_OK) return false;

    ReaderPtr r(archive_read_new(), archive_read_free);
    if (!r) return false;
    return support_read_filter(r.get(), filter) == ARCHIVE_OK;
}

bool tar_supported() {
    WriterPtr w(archive_write_new(), archive_write_free);
    ReaderPtr r(archive_read_new(), archive_read_free);
    if (!w || !r) return false;
    return archive_write_set_format_pax_restricted(w.get()) == ARCHIVE_OK &&
           archive_read_support_format_tar(r.get()) == ARCHIVE_OK;
}

void create_tar(const fs::path& tar_path, const fs::path& source, ArchiveFilter filter,
                const std::vector<fs::path>& exclude) {
    fs::path root_name = archive_root_name(source);

    WriterPtr a(archive_write_new(), archive_write_free);
    if (!a) throw std::runtime_error("Failed to create archive writer");

    archive_write_set_format_pax_restricted(a.get());
    if (add_filter(a.get(), filter) < ARCHIVE_WARN) {
        throw std::runtime_error("Compression filter unavailable: " + archive_err(a.get()));
    }

    if (archive_write_open_filename(a.get(), tar_path.string().c_str()) != ARCHIVE_OK) {
        throw std::runtime_error("Failed to open archive file: " + archive_err(a.get()));
    }

    // Identity of everything that must not go in, taken once the archive
    // file exists so a source that contains it still packs.
    std::vector<std::pair<dev_t, ino_t>> skip;
    std::vector<fs::path> skip_paths = exclude;
    skip_paths.push_back(tar_path);
    for (const auto& p : skip_paths) {
        struct stat st;
        if (lstat(p.c_str(), &st) == 0) skip.emplace_back(st.st_dev, st.st_ino);
    }
    auto skipped = [&skip](const fs::path& p) {
        struct stat st;
        if (lstat(p.c_str(), &st) != 0) return false;
        return std::find(skip.begin(), skip.end(), std::make_pair(st.st_dev, st.st_ino)) != skip.end();
    };

    EntryPtr entry(archive_entry_new(), archive_entry_free);

    write_entry(a.get(), entry.get(), source, root_name.string());

    if (fs::is_directory(fs::symlink_status(source))) {
        // Sorted so the same tree always yields the same byte stream.
        std::vector<fs::path> children;
        for (auto it = fs::recursive_directory_iterator(source);
             it != fs::recursive_directory_iterator(); ++it) {
            if (skipped(it->path())) {
                it.disable_recursion_pending();
                continue;
            }
            children.push_back(it->path());
        }
        std::sort(children.begin(), children.end());

        for (const auto& child : children) {
            fs::path rel = root_name / child.lexically_relative(source);
            write_entry(a.get(), entry.get(), child, rel.generic_string());
        }
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        throw std::runtime_error("Failed to finish archive: " + archive_err(a.get()));
    }
}

size_t extract_tar(const std::vector<fs::path>& parts, const fs::path& dest_dir,
                   bool consume_parts) {
    ReaderPtr a(archive_read_new(), archive_read_free);
    WriterPtr ext(archive_write_disk_new(), archive_write_free);
    if (!a || !ext) throw std::runtime_error("Failed to create archive reader");

    archive_read_support_filter_all(a.get());
    archive_read_support_format_tar(a.get());

    archive_write_disk_set_options(ext.get(),
        ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(ext.get());

    PartStream stream;
    stream.parts = parts;
    stream.consume = consume_parts;

    if (archive_read_open(a.get(), &stream, nullptr, read_parts, nullptr) != ARCHIVE_OK) {
        throw std::runtime_error("Failed to open block stream: " + archive_err(a.get()));
    }

    size_t extracted = 0;
    struct archive_entry* entry = nullptr;
    for (;;) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            throw std::runtime_error("Corrupt archive header: " + archive_err(a.get()));
        }

        fs::path name = archive_entry_pathname(entry);
        if (name.is_absolute()) {
            throw std::runtime_error("Archive entry has an absolute path: " + name.string());
        }
        archive_entry_set_pathname(entry, (dest_dir / name).c_str());

        if (archive_write_header(ext.get(), entry) < ARCHIVE_WARN) {
            throw std::runtime_error("Failed to extract " + name.string() + ": " +
                                     archive_err(ext.get()));
        }
        if (archive_entry_size(entry) > 0) {
            copy_entry_data(a.get(), ext.get());
        }
        if (archive_write_finish_entry(ext.get()) < ARCHIVE_WARN) {
            throw std::runtime_error("Failed to finish " + name.string() + ": " +
                                     archive_err(ext.get()));
        }
        ++extracted;
    }

    if (archive_write_close(ext.get()) != ARCHIVE_OK) {
        throw std::runtime_error("Failed to finish extraction: " + archive_err(ext.get()));
    }
    if (extracted == 0) {
        throw std::runtime_error("Archive stream contained no entries");
    }
    return extracted;
}

} // namespace platform
