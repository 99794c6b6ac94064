// ============================================================
// tree_walker.cpp -- Pre-order walk of one send operand
// ============================================================

#include "tree_walker.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <system_error>

namespace fs = std::filesystem;

TreeWalker::TreeWalker(const std::string& operand)
    : operand_(operand.empty() ? "." : operand) {}

void TreeWalker::walk(const Visitor& visit) {
    WalkEntry root;
    root.abs_path = operand_;
    root.name     = file_io::record_name(operand_, fs::path());
    root.stat     = file_io::stat_entry(operand_.string());

    visit(root);

    if (root.stat.kind == NodeKind::DIRECTORY && root.stat.supported) {
        walk_dir(operand_, fs::path(), visit);
    }
}

void TreeWalker::walk_dir(const fs::path& abs, const fs::path& rel, const Visitor& visit) {
    std::error_code ec;
    fs::directory_iterator it(abs, ec);
    if (ec) {
        LOG_WARN("cannot read directory " + abs.string() + ": " + ec.message());
        ++skipped_;
        return;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;

        WalkEntry we;
        we.abs_path = it->path();
        fs::path child_rel = rel / it->path().filename();
        we.name = file_io::record_name(operand_, child_rel);

        try {
            we.stat = file_io::stat_entry(we.abs_path.string());
        } catch (const FilesystemError& e) {
            // Vanished between readdir and lstat
            LOG_WARN(std::string("skipping: ") + e.what());
            ++skipped_;
            continue;
        }

        visit(we);

        if (we.stat.kind == NodeKind::DIRECTORY && we.stat.supported) {
            walk_dir(we.abs_path, child_rel, visit);
        }
    }

    if (ec) {
        LOG_WARN("error listing " + abs.string() + ": " + ec.message());
        ++skipped_;
    }
}
