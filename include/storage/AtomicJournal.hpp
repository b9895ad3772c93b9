#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace memory_core {
namespace fs = std::filesystem;

// Snapshot writes with a rollback copy: the current file is backed up to
// "<file>.journal" before it is overwritten, and restored if the write fails.
class AtomicJournal {
public:
    static constexpr const char* SUFFIX = ".journal";

    static bool backup(const fs::path& file) {
        std::error_code ec;
        if (!fs::exists(file, ec)) return false;
        fs::copy_file(file, journal_path(file), fs::copy_options::overwrite_existing, ec);
        return !ec;
    }

    static void commit(const fs::path& file) {
        std::error_code ec;
        fs::remove(journal_path(file), ec);
    }

    static bool rollback(const fs::path& file) {
        std::error_code ec;
        fs::path journal = journal_path(file);
        if (!fs::exists(journal, ec)) return false;
        fs::copy_file(journal, file, fs::copy_options::overwrite_existing, ec);
        if (ec) return false;
        fs::remove(journal, ec);
        return true;
    }

    // Returns false when the content could not be written; the previous
    // snapshot (if any) is left in place in that case.
    static bool write_snapshot(const fs::path& file, const std::string& content) {
        bool has_backup = backup(file);
        bool ok = false;
        {
            std::ofstream out(file, std::ios::binary | std::ios::trunc);
            if (out.is_open()) {
                out << content;
                out.flush();
                ok = out.good();
            }
        }
        if (ok) {
            if (has_backup) commit(file);
        } else if (has_backup) {
            rollback(file);
        }
        return ok;
    }

    static fs::path journal_path(const fs::path& file) {
        return fs::path(file.string() + SUFFIX);
    }
};

} // namespace memory_core
