#include <kiln/fsutil.hpp>
#include <kiln/sha256.hpp>

#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace kiln {

Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return KilnError{KilnError::IO, "cannot open " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::ok(ss.str());
}

std::string unique_token() {
    uint8_t bytes[8] = {};
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom.read(reinterpret_cast<char*>(bytes), sizeof(bytes))) {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        uint64_t r = gen();
        for (auto& b : bytes) {
            b = static_cast<uint8_t>(r);
            r >>= 8;
        }
    }

    static const char hex_chars[] = "0123456789abcdef";
    std::string out = std::to_string(getpid()) + "-";
    for (uint8_t b : bytes) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0f];
    }
    return out;
}

static fs::path temp_sibling(const fs::path& path) {
    return path.parent_path() / ("." + path.filename().string() + ".tmp-" + unique_token());
}

Status write_file_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return KilnError{KilnError::IO,
                "cannot create " + path.parent_path().string() + ": " + ec.message()};
        }
    }

    fs::path tmp = temp_sibling(path);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out << content;
        out.flush();
        if (!out) {
            fs::remove(tmp, ec);
            return KilnError{KilnError::IO, "cannot write " + tmp.string()};
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return KilnError{KilnError::IO,
            "cannot move " + tmp.string() + " into place: " + ec.message()};
    }
    return ok_status();
}

Status copy_file_atomic(const fs::path& src, const fs::path& dest) {
    std::error_code ec;
    if (dest.has_parent_path()) {
        fs::create_directories(dest.parent_path(), ec);
        if (ec) {
            return KilnError{KilnError::IO,
                "cannot create " + dest.parent_path().string() + ": " + ec.message()};
        }
    }

    fs::path tmp = temp_sibling(dest);
    fs::copy_file(src, tmp, fs::copy_options::overwrite_existing, ec);
    if (!ec) fs::rename(tmp, dest, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return KilnError{KilnError::IO,
            "cannot copy " + src.string() + " to " + dest.string() + ": " + ec.message()};
    }
    return ok_status();
}

Result<CopyStats> copy_tree(const fs::path& src, const fs::path& dest,
                            const GlobSet& exclude) {
    std::error_code ec;
    if (!fs::is_directory(src, ec)) {
        return KilnError{KilnError::IO, "not a directory: " + src.string()};
    }
    fs::create_directories(dest, ec);
    if (ec) {
        return KilnError{KilnError::IO,
            "cannot create " + dest.string() + ": " + ec.message()};
    }

    CopyStats stats;
    fs::recursive_directory_iterator it(src, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        const fs::path rel = it->path().lexically_relative(src);
        const fs::path target = dest / rel;

        if (exclude.matches(rel.generic_string())) {
            if (it->is_directory(ec)) it.disable_recursion_pending();
            continue;
        }

        auto status = it->symlink_status(ec);
        if (ec) break;

        if (fs::is_symlink(status)) {
            auto link = fs::read_symlink(it->path(), ec);
            if (ec) break;
            fs::remove(target, ec);
            fs::create_symlink(link, target, ec);
        } else if (fs::is_directory(status)) {
            fs::create_directories(target, ec);
        } else if (fs::is_regular_file(status)) {
            fs::copy_file(it->path(), target, fs::copy_options::overwrite_existing, ec);
            if (ec) break;
            fs::permissions(target, status.permissions(), ec);
            if (ec) break;
            auto mtime = it->last_write_time(ec);
            if (ec) break;
            fs::last_write_time(target, mtime, ec);
            stats.files += 1;
            stats.bytes += static_cast<int64_t>(it->file_size(ec));
        }
        if (ec) break;
    }

    if (ec) {
        return KilnError{KilnError::IO,
            "copying " + src.string() + " to " + dest.string() + " failed: " + ec.message()};
    }

    // Directory times change while children are written; restore them last
    for (fs::recursive_directory_iterator d(src, ec); !ec && d != end; d.increment(ec)) {
        std::error_code ignored;
        if (d->is_symlink(ignored) || !d->is_directory(ignored)) continue;
        const fs::path rel = d->path().lexically_relative(src);
        if (fs::exists(dest / rel, ignored)) {
            fs::last_write_time(dest / rel, fs::last_write_time(d->path(), ignored), ignored);
        }
    }

    return Result<CopyStats>::ok(stats);
}

Result<TreeDigest> hash_tree(const fs::path& root, const GlobSet& exclude) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return KilnError{KilnError::NotFound, "not a directory: " + root.string()};
    }

    struct Item {
        std::string rel;
        fs::path path;
        bool link;
    };
    std::vector<Item> items;

    fs::recursive_directory_iterator it(root, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        std::string rel = it->path().lexically_relative(root).generic_string();
        if (exclude.matches(rel)) {
            if (it->is_directory(ec)) it.disable_recursion_pending();
            continue;
        }
        if (it->is_symlink(ec)) {
            items.push_back({rel, it->path(), true});
        } else if (it->is_regular_file(ec)) {
            items.push_back({rel, it->path(), false});
        }
    }
    if (ec) {
        return KilnError{KilnError::IO, "cannot walk " + root.string() + ": " + ec.message()};
    }

    std::sort(items.begin(), items.end(),
              [](const Item& a, const Item& b) { return a.rel < b.rel; });

    SHA256 tree;
    TreeDigest digest;
    for (const auto& item : items) {
        tree.update(item.link ? "link " : "file ");
        tree.update(item.rel);
        tree.update(std::string_view("\0", 1));

        if (item.link) {
            auto target = fs::read_symlink(item.path, ec);
            if (ec) {
                return KilnError{KilnError::IO, "cannot read link " + item.path.string()};
            }
            tree.update(target.generic_string());
        } else {
            KILN_TRY_ASSIGN(file_hash, SHA256::hash_file(item.path));
            tree.update(file_hash);
            digest.files += 1;
            digest.bytes += static_cast<int64_t>(fs::file_size(item.path, ec));
        }
        tree.update("\n");
    }

    digest.hex = SHA256::to_hex(tree.finalize());
    return Result<TreeDigest>::ok(std::move(digest));
}

Result<fs::file_time_type> newest_mtime(const fs::path& root) {
    std::error_code ec;
    auto newest = fs::last_write_time(root, ec);
    if (ec) {
        return KilnError{KilnError::IO, "cannot stat " + root.string() + ": " + ec.message()};
    }
    if (!fs::is_directory(root, ec)) {
        return Result<fs::file_time_type>::ok(newest);
    }

    fs::recursive_directory_iterator it(root, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        if (it->is_symlink(ec)) continue;
        auto t = it->last_write_time(ec);
        if (ec) break;
        newest = std::max(newest, t);
    }
    if (ec) {
        return KilnError{KilnError::IO, "cannot walk " + root.string() + ": " + ec.message()};
    }
    return Result<fs::file_time_type>::ok(newest);
}

Status remove_tree(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return KilnError{KilnError::IO, "cannot remove " + path.string() + ": " + ec.message()};
    }
    return ok_status();
}

} // namespace kiln
