#include "csync/sync/rsync_transfer.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <future>
#include <set>
#include <sstream>

namespace csync::sync {
namespace fs = std::filesystem;
namespace bp = boost::process;

namespace {

std::string with_trailing_slash(const fs::path& root) {
    std::string text = root.generic_string();
    if (text.empty() || text.back() != '/') {
        text.push_back('/');
    }
    return text;
}

std::string trim_reason(std::string text) {
    const auto first = text.find_first_not_of(": \t\r");
    if (first == std::string::npos) {
        return {};
    }
    text.erase(0, first);
    const auto last = text.find_last_not_of(": \t\r");
    return text.substr(0, last + 1);
}

std::string relativize(const std::string& path, const TransferRequest& request) {
    for (const auto* root : {&request.source_root, &request.destination_root}) {
        const std::string prefix = with_trailing_slash(*root);
        if (path.compare(0, prefix.size(), prefix) == 0) {
            return path.substr(prefix.size());
        }
    }
    return path;
}

} // namespace

FilterFile::FilterFile(const std::vector<std::string>& lines, const fs::path& directory) {
    std::string name = (directory / "csync-filter-XXXXXX.rules").string();
    // mkstemps opens with O_CREAT | O_EXCL and mode 0600, so an existing
    // path (or a link planted there) is never reused.
    const int fd = ::mkstemps(name.data(), 6);
    if (fd < 0) {
        error_ = std::strerror(errno);
        return;
    }
    path_ = name;

    std::string content;
    for (const auto& line : lines) {
        content += line;
        content += '\n';
    }
    std::size_t written = 0;
    while (written < content.size()) {
        const auto n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_ = std::strerror(errno);
            break;
        }
        written += static_cast<std::size_t>(n);
    }
    if (::close(fd) != 0 && error_.empty()) {
        error_ = std::strerror(errno);
    }
}

FilterFile::~FilterFile() {
    if (!path_.empty()) {
        std::error_code ec;
        fs::remove(path_, ec);
    }
}

RsyncTransfer::RsyncTransfer(std::string binary, std::vector<std::string> extra_arguments)
    : binary_(std::move(binary)), extra_arguments_(std::move(extra_arguments)) {}

std::vector<std::string> RsyncTransfer::build_arguments(const TransferRequest& request,
                                                        const fs::path& filter_file) const {
    std::vector<std::string> arguments{"-a", "--copy-links", "--itemize-changes"};
    if (request.mirror) {
        arguments.emplace_back("--delete");
    }
    if (request.checksum) {
        arguments.emplace_back("--checksum");
    }
    arguments.push_back("--filter=merge " + filter_file.string());
    arguments.insert(arguments.end(), extra_arguments_.begin(), extra_arguments_.end());
    arguments.push_back(with_trailing_slash(request.source_root));
    arguments.push_back(with_trailing_slash(request.destination_root));
    return arguments;
}

TransferOutcome RsyncTransfer::transfer(const TransferRequest& request) {
    TransferOutcome outcome;

    FilterFile filter(request.filter_lines);
    if (!filter.ok()) {
        outcome.exit_code = 1;
        outcome.diagnostics = "cannot write filter file in " + fs::temp_directory_path().string() + ": " +
                              filter.error();
        return outcome;
    }

    const auto arguments = build_arguments(request, filter.path());
    boost::filesystem::path executable = binary_.find('/') != std::string::npos
        ? boost::filesystem::path(binary_)
        : bp::search_path(binary_);
    if (executable.empty()) {
        outcome.exit_code = 127;
        outcome.diagnostics = binary_ + ": not found in PATH";
        return outcome;
    }

    spdlog::debug("Running {} with {} arguments", executable.string(), arguments.size());

    std::string stdout_text;
    try {
        boost::asio::io_context io;
        std::future<std::string> out;
        std::future<std::string> err;
        bp::child child(bp::exe = executable.string(), bp::args = arguments,
                        bp::std_in.close(), bp::std_out > out, bp::std_err > err, io);
        io.run();
        child.wait();
        outcome.exit_code = child.exit_code();
        stdout_text = out.get();
        outcome.diagnostics = err.get();
    } catch (const bp::process_error& e) {
        outcome.exit_code = 127;
        outcome.diagnostics = std::string("cannot run ") + binary_ + ": " + e.what();
        return outcome;
    }

    std::size_t changed = 0;
    std::size_t deleted = 0;
    std::istringstream lines(stdout_text);
    for (std::string line; std::getline(lines, line);) {
        if (line.rfind("*deleting", 0) == 0) {
            ++deleted;
        } else if (line.rfind(">f", 0) == 0 || line.rfind("cd", 0) == 0) {
            ++changed;
        }
    }
    spdlog::debug("rsync reported {} transfers, {} deletions", changed, deleted);

    if (outcome.exit_code == 23 || outcome.exit_code == 24) {
        outcome.failures = parse_failures(outcome.diagnostics, request);
    }
    return outcome;
}

std::vector<FailedPath> RsyncTransfer::parse_failures(const std::string& diagnostics,
                                                      const TransferRequest& request) {
    std::vector<FailedPath> failures;
    std::set<std::string> seen;

    std::istringstream input(diagnostics);
    for (std::string line; std::getline(input, line);) {
        if (line.rfind("rsync error:", 0) == 0) {
            continue;  // summary line, no path
        }

        std::string path;
        std::string reason;

        const auto open_quote = line.find('"');
        const auto close_quote = open_quote == std::string::npos ? std::string::npos : line.find('"', open_quote + 1);
        if (close_quote != std::string::npos) {
            path = line.substr(open_quote + 1, close_quote - open_quote - 1);
            reason = trim_reason(line.substr(close_quote + 1));
            if (reason.empty()) {
                reason = trim_reason(line.substr(0, open_quote));
            }
        } else {
            const auto failed = line.find(") failed");
            const auto open_paren = failed == std::string::npos ? std::string::npos : line.rfind('(', failed);
            if (open_paren == std::string::npos) {
                continue;
            }
            path = line.substr(open_paren + 1, failed - open_paren - 1);
            reason = trim_reason(line.substr(failed + 8));
        }

        path = relativize(path, request);
        if (path.empty() || !seen.insert(path).second) {
            continue;
        }
        failures.push_back({path, reason.empty() ? line : reason});
    }
    return failures;
}

} // namespace csync::sync
