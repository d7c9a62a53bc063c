#include "csync/sync/tree_scanner.hpp"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>

namespace csync::sync {
namespace fs = std::filesystem;

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string to_hex(const unsigned char* data, unsigned int length) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // namespace

Result<TreeListing> TreeScanner::scan(const fs::path& root) const {
    std::error_code ec;
    const auto status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
        return Err<TreeListing>(access_error("scan root does not exist: " + root.string()));
    }
    if (!fs::is_directory(status)) {
        return Err<TreeListing>(access_error("scan root is not a directory: " + root.string()));
    }

    WalkState state;
    state.root = fs::canonical(root, ec);
    if (ec) {
        return Err<TreeListing>(access_error("cannot resolve scan root " + root.string() + ": " + ec.message()));
    }
    state.active_dirs.push_back(state.root);

    if (auto walked = walk(state.root, {}, state); walked.is_error()) {
        return Err<TreeListing>(walked.error());
    }

    spdlog::debug("Scanned {} entries under {}", state.listing.size(), root.string());
    return Ok(std::move(state.listing));
}

Result<void> TreeScanner::walk(const fs::path& directory,
                               const std::string& relative,
                               WalkState& state) const {
    std::error_code ec;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path absolute = it->path();
        const std::string name = absolute.filename().generic_string();
        const std::string entry_path = relative.empty() ? name : relative + "/" + name;

        std::error_code entry_ec;
        const bool is_link = it->is_symlink(entry_ec);
        if (entry_ec) {
            return Err<void>(access_error("cannot stat " + absolute.string() + ": " + entry_ec.message()));
        }

        fs::path resolved = absolute;
        if (is_link) {
            resolved = fs::canonical(absolute, entry_ec);
            if (entry_ec) {
                return Err<void>(access_error("cannot resolve symlink " + absolute.string() + ": " + entry_ec.message()));
            }
            if (!is_within(state.root, resolved)) {
                return Err<void>(traversal_error("symlink " + entry_path + " points outside the tree: " + resolved.string()));
            }
        }

        const auto status = fs::status(resolved, entry_ec);
        if (entry_ec) {
            return Err<void>(access_error("cannot stat " + absolute.string() + ": " + entry_ec.message()));
        }

        Entry entry;
        entry.path = entry_path;
        entry.symlink = is_link;

        if (fs::is_directory(status)) {
            const fs::path canonical_dir = is_link ? resolved : fs::canonical(absolute, entry_ec);
            if (entry_ec) {
                return Err<void>(access_error("cannot resolve " + absolute.string() + ": " + entry_ec.message()));
            }
            if (std::find(state.active_dirs.begin(), state.active_dirs.end(), canonical_dir) != state.active_dirs.end()) {
                return Err<void>(traversal_error("symlink loop at " + entry_path));
            }

            entry.kind = EntryKind::Directory;
            state.listing.emplace(entry_path, entry);

            state.active_dirs.push_back(canonical_dir);
            auto nested = walk(absolute, entry_path, state);
            state.active_dirs.pop_back();
            if (nested.is_error()) {
                return nested;
            }
            continue;
        }

        if (!fs::is_regular_file(status)) {
            return Err<void>(access_error("unsupported file type: " + absolute.string()));
        }

        auto fingerprint = fingerprint_file(absolute);
        if (fingerprint.is_error()) {
            return Err<void>(fingerprint.error());
        }
        entry.kind = EntryKind::File;
        entry.fingerprint = std::move(fingerprint.value());
        state.listing.emplace(entry_path, std::move(entry));
    }

    if (ec) {
        return Err<void>(access_error("cannot read directory " + directory.string() + ": " + ec.message()));
    }
    return Ok();
}

Result<Fingerprint> TreeScanner::fingerprint_file(const fs::path& file) {
    std::ifstream input(file, std::ios::binary);
    if (!input) {
        return Err<Fingerprint>(access_error("cannot open " + file.string()));
    }

    DigestContext context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!context || EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
        return Err<Fingerprint>(access_error("cannot initialise SHA-256 for " + file.string()));
    }

    Fingerprint fingerprint;
    char buffer[64 * 1024];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (EVP_DigestUpdate(context.get(), buffer, count) != 1) {
            return Err<Fingerprint>(access_error("SHA-256 update failed for " + file.string()));
        }
        fingerprint.size += count;
    }
    if (input.bad()) {
        return Err<Fingerprint>(access_error("read error in " + file.string()));
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context.get(), digest, &length) != 1) {
        return Err<Fingerprint>(access_error("SHA-256 finalise failed for " + file.string()));
    }
    fingerprint.checksum = to_hex(digest, length);
    return Ok(std::move(fingerprint));
}

bool TreeScanner::is_within(const fs::path& root, const fs::path& candidate) {
    auto root_it = root.begin();
    auto candidate_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++candidate_it) {
        if (candidate_it == candidate.end() || *root_it != *candidate_it) {
            return false;
        }
    }
    return true;
}

} // namespace csync::sync
